/**
 * dump.hpp
 *
 * Diagnostic exports: raw memory images and register snapshots.
 */

#ifndef DUMP_HPP
#define DUMP_HPP

#include "common.hpp"
#include "adau1467.hpp"
#include "register_bank.hpp"

class ExportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Raw big-endian 32-bit words
void write_words(std::ostream& out, const std::vector<Word>& words);

// Dump count words from start on the given page; throws ExportError
void save_memory(Adau1467& device, const std::string& path, Address start, size_t count, Page page);

// [{"address":61440,"value":96},...] in address order
std::string registers_to_json(const RegisterBank& bank);

// Write registers_to_json() to a file; throws ExportError
void save_registers(const RegisterBank& bank, const std::string& path);

#endif // DUMP_HPP
