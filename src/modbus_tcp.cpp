#include "modbus_tcp.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

ModbusTcpClient::~ModbusTcpClient() { close(); }

void ModbusTcpClient::connect_to(const std::string& ip, uint16_t port, uint8_t unit_id, int timeout_ms) {
    std::lock_guard<std::mutex> lk(mx_);
    close_locked();
    ip_ = ip; port_ = port; unit_id_ = unit_id; timeout_ms_ = timeout_ms;
    endpoint_ = ip_+":"+std::to_string(port_);

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, ip_.c_str(), &addr.sin_addr) != 1)
        throw std::runtime_error("bad IPv4 address: "+ip_);

    int s = ::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (s < 0) throw std::runtime_error(std::string("socket() failed: ")+std::strerror(errno));

    timeval tv{};
    tv.tv_sec  = timeout_ms_ / 1000;
    tv.tv_usec = (timeout_ms_ % 1000) * 1000;
    setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
    setsockopt(s, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));

    if (::connect(s, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        int err = errno;
        ::close(s);
        throw std::runtime_error("connect "+endpoint_+" failed: "+std::strerror(err));
    }
    fd_ = s;
}

void ModbusTcpClient::reconnect() {
    std::string ip; uint16_t port; uint8_t uid; int tmo;
    {
        std::lock_guard<std::mutex> lk(mx_);
        ip = ip_; port = port_; uid = unit_id_; tmo = timeout_ms_;
    }
    if (ip.empty()) throw std::runtime_error("reconnect before connect");
    connect_to(ip, port, uid, tmo);
}

void ModbusTcpClient::close() {
    std::lock_guard<std::mutex> lk(mx_);
    close_locked();
}

void ModbusTcpClient::close_locked() {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
}

bool ModbusTcpClient::is_ok() const {
    std::lock_guard<std::mutex> lk(mx_);
    return fd_ >= 0;
}

bool ModbusTcpClient::write_coil(uint16_t addr, bool on) {
    std::vector<uint8_t> pdu{0x05};
    put_u16(pdu, addr);
    put_u16(pdu, on ? 0xFF00 : 0x0000);
    auto resp = xfer(pdu);
    return resp.size()==5 && resp[0]==0x05;
}

std::optional<bool> ModbusTcpClient::read_coil(uint16_t addr) {
    std::vector<uint8_t> pdu{0x01};
    put_u16(pdu, addr);
    put_u16(pdu, 1);
    auto resp = xfer(pdu);
    if (resp.size()>=3 && resp[0]==0x01 && resp[1]==0x01)
        return (resp[2] & 0x01) != 0;
    return std::nullopt;
}

bool ModbusTcpClient::write_holding(uint16_t addr, uint16_t val) {
    std::vector<uint8_t> pdu{0x06};
    put_u16(pdu, addr);
    put_u16(pdu, val);
    auto resp = xfer(pdu);
    return resp.size()==5 && resp[0]==0x06;
}

std::vector<uint16_t> ModbusTcpClient::read_holding(uint16_t addr, uint16_t count) {
    std::vector<uint8_t> pdu{0x03};
    put_u16(pdu, addr);
    put_u16(pdu, count);
    auto resp = xfer(pdu);
    std::vector<uint16_t> out;
    if (resp.size()>=2 && resp[0]==0x03) {
        uint8_t bc = resp[1];
        if (bc == count*2 && resp.size() == (size_t)(2+bc)) {
            for (uint16_t i=0;i<count;++i)
                out.push_back(uint16_t((resp[2+i*2]<<8) | resp[3+i*2]));
        }
    }
    return out;
}

void ModbusTcpClient::put_u16(std::vector<uint8_t>& buf, uint16_t v) {
    buf.push_back(uint8_t((v>>8) & 0xFF));
    buf.push_back(uint8_t(v & 0xFF));
}

std::vector<uint8_t> ModbusTcpClient::xfer(const std::vector<uint8_t>& pdu) {
    std::lock_guard<std::mutex> lk(mx_);
    if (fd_ < 0) throw std::runtime_error("socket closed");

    // MBAP: txid, protocol 0, length (unit id + pdu), unit id
    std::vector<uint8_t> req;
    uint16_t tx = ++txid_;
    put_u16(req, tx);
    put_u16(req, 0x0000);
    put_u16(req, uint16_t(pdu.size()+1));
    req.push_back(unit_id_);
    req.insert(req.end(), pdu.begin(), pdu.end());

    ssize_t sent = ::send(fd_, req.data(), req.size(), MSG_NOSIGNAL);
    if (sent != (ssize_t)req.size()) { close_locked(); throw std::runtime_error("send failed"); }

    uint8_t mbap[7];
    if (!recv_all(mbap, 7)) { close_locked(); throw std::runtime_error("recv mbap failed"); }

    uint16_t rx_tx  = uint16_t((mbap[0]<<8) | mbap[1]);
    uint16_t rx_len = uint16_t((mbap[4]<<8) | mbap[5]);
    if (rx_tx != tx)          { close_locked(); throw std::runtime_error("transaction id mismatch"); }
    if (mbap[6] != unit_id_)  { close_locked(); throw std::runtime_error("unit id mismatch"); }
    if (rx_len < 2 || rx_len > 254) { close_locked(); throw std::runtime_error("bad length"); }

    std::vector<uint8_t> resp(rx_len - 1);
    if (!recv_all(resp.data(), resp.size())) { close_locked(); throw std::runtime_error("recv pdu failed"); }

    if (resp[0] & 0x80) {
        uint8_t fc = resp[0] & 0x7F;
        uint8_t ex = resp.size()>1 ? resp[1] : 0;
        throw std::runtime_error("Modbus exception fc="+std::to_string(fc)+" code="+std::to_string(ex));
    }
    return resp;
}

bool ModbusTcpClient::recv_all(uint8_t* buf, size_t len) {
    size_t total = 0;
    while (total < len) {
        ssize_t r = ::recv(fd_, buf+total, len-total, 0);
        if (r < 0 && errno == EINTR) continue;
        if (r <= 0) return false;
        total += size_t(r);
    }
    return true;
}
