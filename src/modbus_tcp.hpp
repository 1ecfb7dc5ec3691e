#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Минимальный Modbus/TCP клиент (FC1, FC3, FC5, FC6) на POSIX-сокетах.
// Ошибки транспорта -> std::runtime_error, соединение при этом закрывается.
class ModbusTcpClient {
public:
    ModbusTcpClient() = default;
    ~ModbusTcpClient();
    ModbusTcpClient(const ModbusTcpClient&) = delete;
    ModbusTcpClient& operator=(const ModbusTcpClient&) = delete;

    void connect_to(const std::string& ip, uint16_t port, uint8_t unit_id, int timeout_ms = 1000);
    void reconnect();
    void close();
    bool is_ok() const;

    bool write_coil(uint16_t addr, bool on);                  // FC5
    std::optional<bool> read_coil(uint16_t addr);             // FC1 (1 бит)
    bool write_holding(uint16_t addr, uint16_t val);          // FC6
    std::vector<uint16_t> read_holding(uint16_t addr, uint16_t count); // FC3

    const std::string& endpoint() const { return endpoint_; }

private:
    static void put_u16(std::vector<uint8_t>& buf, uint16_t v);
    std::vector<uint8_t> xfer(const std::vector<uint8_t>& pdu);
    bool recv_all(uint8_t* buf, size_t len);
    void close_locked();

    mutable std::mutex mx_;           // один запрос в полёте
    int fd_{-1};
    std::string ip_;
    std::string endpoint_;
    uint16_t port_{502};
    uint8_t  unit_id_{1};
    int      timeout_ms_{1000};
    uint16_t txid_{0};
};
