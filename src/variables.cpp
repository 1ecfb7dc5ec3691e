#include "variables.hpp"
#include "log.hpp"

std::optional<std::string> VariableStore::get(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mx_);
    auto it = values_.find(name);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

void VariableStore::on_change(const std::string& name, ChangeHandler h) {
    std::lock_guard<std::mutex> lk(mx_);
    handlers_.emplace(name, std::move(h));
}

void VariableStore::unsubscribe_all() {
    std::lock_guard<std::mutex> lk(mx_);
    handlers_.clear();
}

void VariableStore::mark_in_use(const std::string& name) {
    std::lock_guard<std::mutex> lk(mx_);
    in_use_.insert(name);
}

void VariableStore::clear_all_in_use() {
    std::lock_guard<std::mutex> lk(mx_);
    in_use_.clear();
}

void VariableStore::on_rename(RenameHandler h) {
    std::lock_guard<std::mutex> lk(mx_);
    rename_handlers_.push_back(std::move(h));
}

bool VariableStore::in_use(const std::string& name) const {
    std::lock_guard<std::mutex> lk(mx_);
    return in_use_.count(name) > 0;
}

std::vector<std::string> VariableStore::names() const {
    std::lock_guard<std::mutex> lk(mx_);
    std::vector<std::string> out;
    for (auto& kv : values_) out.push_back(kv.first);
    return out;
}

void VariableStore::set(const std::string& name, const std::string& value) {
    std::vector<ChangeHandler> to_call;
    {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = values_.find(name);
        if (it != values_.end() && it->second == value) return;
        values_[name] = value;
        auto range = handlers_.equal_range(name);
        for (auto h = range.first; h != range.second; ++h) to_call.push_back(h->second);
    }
    Log::debug("variable "+name+" = "+value);
    for (auto& h : to_call) h(name);
}

bool VariableStore::rename(const std::string& old_name, const std::string& new_name) {
    std::vector<RenameHandler> to_call;
    {
        std::lock_guard<std::mutex> lk(mx_);
        auto it = values_.find(old_name);
        if (it == values_.end() || values_.count(new_name)) return false;
        values_[new_name] = it->second;
        values_.erase(it);
        if (in_use_.erase(old_name)) in_use_.insert(new_name);
        to_call = rename_handlers_;
    }
    for (auto& h : to_call) h(old_name, new_name);
    return true;
}

std::string HubMode::current_mode() const {
    std::lock_guard<std::mutex> lk(mx_);
    return mode_;
}

void HubMode::set_mode(const std::string& mode) {
    std::lock_guard<std::mutex> lk(mx_);
    mode_ = mode;
}
