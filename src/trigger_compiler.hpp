#pragma once
#include "model.hpp"
#include "time_resolver.hpp"
#include <optional>

// Минутная гранулярность: секунды отбрасываются. Пустой набор дней -> nullopt.
std::optional<RecurringTrigger> compile_trigger(const Stamp& wall, DaySet days);
std::optional<RecurringTrigger> compile_trigger(const ResolvedTime& t, DaySet days);
