#pragma once
#include "model.hpp"
#include "services.hpp"
#include <ctime>
#include <optional>
#include <string>

struct ResolveContext {
    std::time_t now{0};
    const SolarProvider*  solar{nullptr};
    const VariableSource* vars{nullptr};
};

// Конкретное время срабатывания
struct ResolvedTime {
    std::time_t instant{0};
    Stamp       wall;          // настенное время, из него берутся час/минута
    std::string text;          // для переменной со смещением 0 совпадает с исходным значением
};

// Pure given the provider snapshot. Returns nullopt when the time cannot be resolved.
std::optional<ResolvedTime> resolve_time(const TimeSpec& spec, const ResolveContext& ctx);
