#pragma once
#include "services.hpp"
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Именованные переменные даты/времени (аналог hub variables)
class VariableStore : public VariableSource {
public:
    std::optional<std::string> get(const std::string& name) const override;
    void on_change(const std::string& name, ChangeHandler h) override;
    void unsubscribe_all() override;
    void mark_in_use(const std::string& name) override;
    void clear_all_in_use() override;
    void on_rename(RenameHandler h) override;

    // Sets the value and notifies subscribers of `name` if it changed.
    void set(const std::string& name, const std::string& value);
    // false if `old_name` does not exist or `new_name` is taken
    bool rename(const std::string& old_name, const std::string& new_name);

    bool in_use(const std::string& name) const;
    std::vector<std::string> names() const;

private:
    mutable std::mutex mx_;
    std::map<std::string, std::string> values_;
    std::multimap<std::string, ChangeHandler> handlers_;
    std::vector<RenameHandler> rename_handlers_;
    std::set<std::string> in_use_;
};

class HubMode : public HubState {
public:
    explicit HubMode(std::string mode) : mode_(std::move(mode)) {}
    std::string current_mode() const override;
    void set_mode(const std::string& mode);

private:
    mutable std::mutex mx_;
    std::string mode_;
};
