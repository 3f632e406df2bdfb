/**
 * dump.cpp
 *
 * Implementation of the diagnostic exports.
 */

#include "dump.hpp"
#include <cerrno>
#include <cstring>

namespace {

std::string io_message(const std::string& path) {
    std::string reason = (errno != 0) ? std::strerror(errno) : "stream error";
    return "Exception while writing file " + path + ": " + reason;
}

std::ofstream open_for_write(const std::string& path, std::ios::openmode mode) {
    errno = 0;
    std::ofstream out(path, mode | std::ios::out | std::ios::trunc);
    if (!out) {
        throw ExportError(io_message(path));
    }
    return out;
}

void finish(std::ofstream& out, const std::string& path) {
    out.flush();
    if (!out) {
        throw ExportError(io_message(path));
    }
}

} // namespace

void write_words(std::ostream& out, const std::vector<Word>& words) {
    for (Word w : words) {
        char bytes[4] = {
            static_cast<char>((w >> 24) & 0xFF),
            static_cast<char>((w >> 16) & 0xFF),
            static_cast<char>((w >> 8) & 0xFF),
            static_cast<char>(w & 0xFF)
        };
        out.write(bytes, sizeof(bytes));
    }
}

void save_memory(Adau1467& device, const std::string& path, Address start, size_t count, Page page) {
    std::vector<Word> words = device.read_memory_block(start, count, page);

    std::ofstream out = open_for_write(path, std::ios::binary);
    write_words(out, words);
    finish(out, path);
}

std::string registers_to_json(const RegisterBank& bank) {
    std::ostringstream oss;
    oss << "[";
    bool first = true;
    for (Address addr : bank.addresses()) {
        if (!first) oss << ",";
        first = false;
        oss << "{\"address\":" << addr << ",\"value\":" << bank.read(addr).value_or(0) << "}";
    }
    oss << "]";
    return oss.str();
}

void save_registers(const RegisterBank& bank, const std::string& path) {
    std::string json = registers_to_json(bank);

    std::ofstream out = open_for_write(path, std::ios::out);
    out << json;
    finish(out, path);
}
