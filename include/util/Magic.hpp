#pragma once

#include <mutex>
#include <string>
#include <magic.h>

namespace lc::util {

// libmagic cookies are not thread-safe; calls are serialized per instance
class Magic {
public:
    Magic();
    ~Magic();

    Magic(const Magic&) = delete;
    Magic& operator=(const Magic&) = delete;

    std::string mime_type(const std::string& path) const;

    static std::string get_mime_type(const std::string& path);

private:
    magic_t cookie;
    mutable std::mutex mutex_;
};

}
