#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace sw::notify {

class NotifyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class Notifier {
public:
    virtual ~Notifier() = default;

    // Delivers text to destination. Throws NotifyError when delivery fails.
    virtual void send(int64_t destination, const std::string& text) = 0;
};

}
