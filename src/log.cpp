#include "log.hpp"

#include <iostream>
#include <mutex>

namespace {
std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

void write_line(std::ostream& os, const std::string& tag, const std::string& msg) {
    std::lock_guard<std::mutex> lk(output_mutex());
    os << tag << ' ' << msg << std::endl;
}
} // namespace

void log_info(const std::string& msg) {
    write_line(std::cout, "[INFO]", msg);
}

void log_tagged(const std::string& tag, const std::string& msg) {
    write_line(std::cout, "[" + tag + "]", msg);
}

void log_warn(const std::string& msg) {
    write_line(std::cerr, "[WARN]", msg);
}

void log_error(const std::string& msg) {
    write_line(std::cerr, "[ERROR]", msg);
}
