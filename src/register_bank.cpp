/**
 * register_bank.cpp
 *
 * Implementation of the table-driven register file.
 */

#include "register_bank.hpp"
#include <algorithm>

RegisterBank::RegisterBank(const std::string& name, const std::vector<RegisterSpec>& table,
                           int width, Logger& log)
    : name(name), width(width), log(log) {
    if (width != 16 && width != 32) {
        throw std::invalid_argument("Unsupported register width: " + std::to_string(width));
    }
    width_mask = (width == 32) ? 0xFFFFFFFFu : 0xFFFFu;

    for (const RegisterSpec& s : table) {
        if (cells.count(s.address)) {
            throw std::invalid_argument("Duplicate register address " + to_hex(s.address, 4)
                                        + " in " + name);
        }
        cells[s.address] = Cell{ s, s.reset & width_mask, s.reset & width_mask };
    }
}

void RegisterBank::reset() {
    for (auto& [addr, cell] : cells) {
        cell.value = cell.reset;
    }
}

// =============================================================================
// Bus Access
// =============================================================================

std::optional<Word> RegisterBank::read(Address addr) const {
    auto it = cells.find(addr);
    if (it == cells.end()) return std::nullopt;
    return visible(it->second);
}

WriteResult RegisterBank::write(Address addr, Word value) {
    WriteResult result;
    auto it = cells.find(addr);
    if (it == cells.end()) return result;

    Cell& cell = it->second;
    result.found = true;
    result.previous = cell.value;

    if (cell.spec.access == Access::ReadOnly) {
        log.noisy(name, "Ignoring write to read-only " + std::string(cell.spec.name));
        result.value = cell.value;
        return result;
    }

    Word mask = cell.spec.write_mask & width_mask;
    cell.value = (cell.value & ~mask) | (value & mask);
    result.value = cell.value;
    result.changed = (cell.value != result.previous);
    if (result.changed && cell.spec.access == Access::SideEffect) {
        result.effect = cell.spec.effect;
    }
    return result;
}

bool RegisterBank::set_hardware(Address addr, Word value) {
    auto it = cells.find(addr);
    if (it == cells.end()) return false;
    it->second.value = value & width_mask;
    return true;
}

bool RegisterBank::override_reset(Address addr, Word value) {
    auto it = cells.find(addr);
    if (it == cells.end()) return false;
    it->second.reset = value & width_mask;
    return true;
}

// =============================================================================
// Lookup
// =============================================================================

bool RegisterBank::contains(Address addr) const {
    return cells.count(addr) != 0;
}

const RegisterSpec* RegisterBank::spec(Address addr) const {
    auto it = cells.find(addr);
    return (it != cells.end()) ? &it->second.spec : nullptr;
}

std::optional<Address> RegisterBank::find(const std::string& reg_name) const {
    std::string wanted = reg_name;
    std::transform(wanted.begin(), wanted.end(), wanted.begin(), ::toupper);

    for (const auto& [addr, cell] : cells) {
        if (wanted == cell.spec.name) return addr;
    }
    return std::nullopt;
}

std::vector<Address> RegisterBank::addresses() const {
    std::vector<Address> out;
    out.reserve(cells.size());
    for (const auto& entry : cells) {
        out.push_back(entry.first);
    }
    return out;
}

size_t RegisterBank::size() const {
    return cells.size();
}

int RegisterBank::get_width() const {
    return width;
}

// =============================================================================
// Display
// =============================================================================

void RegisterBank::dump(std::ostream& out) const {
    int digits = width / 4;
    out << "Registers (" << name << "):\n";
    for (const auto& [addr, cell] : cells) {
        out << "  " << to_hex(addr, 4) << "  " << std::setw(24) << std::left << cell.spec.name
            << std::right << "= " << to_hex(visible(cell), digits) << "\n";
    }
}

void RegisterBank::dump_reg(std::ostream& out, Address addr) const {
    auto it = cells.find(addr);
    if (it == cells.end()) {
        out << "Invalid register: " << to_hex(addr, 4) << "\n";
        return;
    }
    const Cell& cell = it->second;
    int digits = width / 4;
    out << cell.spec.name << " @ " << to_hex(addr, 4)
        << " = " << to_hex(visible(cell), digits)
        << " (reset " << to_hex(cell.reset, digits) << ")"
        << (cell.spec.access == Access::ReadOnly ? " [RO]" : "") << "\n";
}

// Stored value with synthesized ready bits forced on
Word RegisterBank::visible(const Cell& cell) const {
    return (cell.value | cell.spec.ready_mask) & width_mask;
}
