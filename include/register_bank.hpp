/**
 * register_bank.hpp
 *
 * Table-driven register file. Each register has a reset value, an access
 * mode and a write mask. Side effects are reported back to the owner in
 * the WriteResult instead of being run here.
 */

#ifndef REGISTER_BANK_HPP
#define REGISTER_BANK_HPP

#include "common.hpp"
#include "log.hpp"

struct WriteResult {
    bool found = false;
    bool changed = false;
    SideEffect effect = SideEffect::None;   // Only set when changed
    Word previous = 0;
    Word value = 0;
};

class RegisterBank {
public:
    // width is 16 or 32 bits
    RegisterBank(const std::string& name, const std::vector<RegisterSpec>& table,
                 int width, Logger& log);

    // Restore every register to its reset value
    void reset();

    // Bus access; nullopt for unknown addresses
    std::optional<Word> read(Address addr) const;
    WriteResult write(Address addr, Word value);

    // Hardware-side update (status bits), ignores access mode and mask
    bool set_hardware(Address addr, Word value);

    // Change the value restored by reset() (variant differences)
    bool override_reset(Address addr, Word value);

    // Lookup
    bool contains(Address addr) const;
    const RegisterSpec* spec(Address addr) const;
    std::optional<Address> find(const std::string& name) const;
    std::vector<Address> addresses() const;
    size_t size() const;
    int get_width() const;

    // Display
    void dump(std::ostream& out) const;
    void dump_reg(std::ostream& out, Address addr) const;

private:
    struct Cell {
        RegisterSpec spec;
        Word reset;
        Word value;
    };

    std::string name;
    int width;
    Word width_mask;
    Logger& log;
    std::map<Address, Cell> cells;

    Word visible(const Cell& cell) const;
};

#endif // REGISTER_BANK_HPP
