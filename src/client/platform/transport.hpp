#pragma once

#include "address.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <string_view>

enum class IoStatus { Timeout, Interrupted, Failed };

struct IoError {
    IoStatus status;
    int code = 0; // errno for Failed
};

class Transport {
public:
    virtual ~Transport() = default;

    // Bytes accepted. 0 means the peer no longer takes data.
    virtual std::expected<size_t, IoError> write(std::string_view data) = 0;

    // Bytes received. 0 means the peer closed the connection.
    virtual std::expected<size_t, IoError> read(std::span<char> buf) = 0;

    virtual void close() = 0;
};

using TransportFactory =
    std::function<std::expected<std::unique_ptr<Transport>, std::string>(const Address&)>;
