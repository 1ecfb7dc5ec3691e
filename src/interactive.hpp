#pragma once
#include "model.hpp"

// Консольный мастер: ПЛК, координаты, устройства, расписания. Бросает при отмене.
Config build_config_interactive();
