#pragma once
#include "model.hpp"
#include "modbus_tcp.hpp"
#include "schedule_store.hpp"
#include <string>

class App {
public:
    int run(int argc, char** argv);
    int run_with_config(Config cfg);

private:
    bool try_connect();
    ScheduleStore load_store() const;

private:
    Config cfg_;
    ModbusTcpClient mb_;
};
