/**
 * console.cpp
 *
 * Front end implementation.
 */

#include "console.hpp"
#include "address_space.hpp"
#include "dump.hpp"
#include "register_map.hpp"
#include <algorithm>

Console::Console(Adau1467& device, Logger& log, std::ostream& out, Byte chip_address)
    : device(device), log(log), out(out), host(device, chip_address),
      running(true), source_depth(0) {}

// =============================================================================
// Scripts
// =============================================================================

bool Console::source(const std::string& filename) {
    if (source_depth >= 8) {
        out << "Script nesting too deep: " << filename << "\n";
        return false;
    }

    std::ifstream file(filename);
    if (!file) {
        out << "Cannot open script: " << filename << "\n";
        return false;
    }

    source_depth++;
    std::string line;
    bool ok = true;
    while (std::getline(file, line)) {
        // '#' starts a comment
        auto hash = line.find('#');
        if (hash != std::string::npos) line.erase(hash);
        if (!execute_command(line)) {
            ok = false;
            break;
        }
    }
    source_depth--;
    return ok;
}

// =============================================================================
// Command Loop
// =============================================================================

void Console::run(std::istream& in) {
    print_welcome();

    std::string input;
    while (running) {
        print_prompt();
        if (!std::getline(in, input)) break;
        if (!execute_command(input)) break;
    }

    out << "Goodbye!\n";
}

bool Console::execute_command(const std::string& input) {
    auto tokens = tokenize(input);
    if (tokens.empty()) return true;

    std::string cmd = tokens[0];
    std::transform(cmd.begin(), cmd.end(), cmd.begin(), ::tolower);

    if (cmd == "quit" || cmd == "exit" || cmd == "q") {
        running = false;
        return false;
    }
    else if (cmd == "help" || cmd == "h" || cmd == "?") {
        cmd_help();
    }
    else if (cmd == "write" || cmd == "w") {
        if (tokens.size() < 3) {
            out << "Usage: write <addr> <value> [value...]\n";
            return true;
        }
        auto addr = resolve_address(tokens[1]);
        if (!addr) return true;
        std::vector<Word> values;
        for (size_t i = 2; i < tokens.size(); i++) {
            auto v = parse_value(tokens[i]);
            if (!v) return true;
            values.push_back(*v);
        }
        cmd_write(*addr, values);
    }
    else if (cmd == "read" || cmd == "r") {
        if (tokens.size() < 2) {
            out << "Usage: read <addr> [count]\n";
            return true;
        }
        auto addr = resolve_address(tokens[1]);
        if (!addr) return true;
        int count = 1;
        if (tokens.size() > 2) {
            auto n = parse_value(tokens[2]);
            if (!n) return true;
            count = static_cast<int>(std::min<Word>(*n, 0x10000));
        }
        cmd_read(*addr, count);
    }
    else if (cmd == "tx") {
        if (tokens.size() < 2) {
            out << "Usage: tx <byte> [byte...]\n";
            return true;
        }
        std::vector<Byte> bytes;
        for (size_t i = 1; i < tokens.size(); i++) {
            auto v = parse_value(tokens[i]);
            if (!v) return true;
            if (*v > 0xFF) {
                out << "Not a byte: " << tokens[i] << "\n";
                return true;
            }
            bytes.push_back(static_cast<Byte>(*v));
        }
        cmd_tx(bytes);
    }
    else if (cmd == "cs") {
        cmd_cs();
    }
    else if (cmd == "reset") {
        cmd_reset();
    }
    else if (cmd == "page") {
        cmd_page(tokens.size() > 1 ? tokens[1] : "");
    }
    else if (cmd == "regs" || cmd == "registers") {
        cmd_regs();
    }
    else if (cmd == "reg") {
        if (tokens.size() < 2) {
            out << "Usage: reg <name|addr>\n";
        } else {
            cmd_reg(tokens[1]);
        }
    }
    else if (cmd == "mem" || cmd == "memory" || cmd == "m") {
        if (tokens.size() < 2) {
            out << "Usage: mem <addr> [count] [a|b]\n";
            return true;
        }
        auto addr = resolve_address(tokens[1]);
        if (!addr) return true;
        int count = 16;
        if (tokens.size() > 2) {
            auto n = parse_value(tokens[2]);
            if (!n) return true;
            count = static_cast<int>(std::min<Word>(*n, 0x10000));
        }
        PageOverride override = PageOverride::CURRENT;
        if (tokens.size() > 3) {
            auto p = parse_page(tokens[3]);
            if (!p) return true;
            override = *p;
        }
        cmd_mem(*addr, count, override);
    }
    else if (cmd == "safeload") {
        if (tokens.size() < 3) {
            out << "Usage: safeload <target> <value> [value...]\n";
            return true;
        }
        auto target = resolve_address(tokens[1]);
        if (!target) return true;
        std::vector<Word> values;
        for (size_t i = 2; i < tokens.size(); i++) {
            auto v = parse_value(tokens[i]);
            if (!v) return true;
            values.push_back(*v);
        }
        cmd_safeload(*target, values);
    }
    else if (cmd == "savemem") {
        if (tokens.size() < 4) {
            out << "Usage: savemem <file> <addr> <count> [a|b]\n";
            return true;
        }
        auto addr = resolve_address(tokens[2]);
        auto n = parse_value(tokens[3]);
        if (!addr || !n) return true;
        Page page = Page::A;
        if (tokens.size() > 4) {
            auto p = parse_page(tokens[4]);
            if (!p) return true;
            page = (*p == PageOverride::FORCE_B) ? Page::B : Page::A;
        }
        cmd_savemem(tokens[1], *addr, static_cast<int>(std::min<Word>(*n, 0x10000)), page);
    }
    else if (cmd == "saveregs") {
        if (tokens.size() < 2) {
            out << "Usage: saveregs <file>\n";
        } else {
            cmd_saveregs(tokens[1]);
        }
    }
    else if (cmd == "source" || cmd == "load") {
        if (tokens.size() < 2) {
            out << "Usage: source <file>\n";
        } else {
            return source(tokens[1]) || running;
        }
    }
    else if (cmd == "stats") {
        cmd_stats();
    }
    else if (cmd == "loglevel") {
        cmd_loglevel(tokens.size() > 1 ? tokens[1] : "");
    }
    else {
        out << "Unknown command: " << cmd << ". Type 'help' for commands.\n";
    }

    return true;
}

// =============================================================================
// Command Implementations
// =============================================================================

void Console::cmd_help() {
    out << "Commands:\n"
        << "  write <addr> <v...>         Write words (burst) over SPI\n"
        << "  read <addr> [n]             Read n words over SPI\n"
        << "  tx <byte...>                Send raw bytes, chip select held\n"
        << "  cs                          Release chip select\n"
        << "  reset                       Pulse nRESET\n"
        << "  page [a|b]                  Show or select memory page\n"
        << "  regs                        Show all control registers\n"
        << "  reg <name|addr>             Show one control register\n"
        << "  mem <addr> [n] [a|b]        Show memory words\n"
        << "  safeload <target> <v...>    Stage and commit up to 5 words\n"
        << "  savemem <file> <addr> <n> [a|b]  Dump memory (big-endian)\n"
        << "  saveregs <file>             Dump registers as JSON\n"
        << "  source <file>               Run commands from file\n"
        << "  stats                       Show statistics\n"
        << "  loglevel [level]            Show or set log threshold\n"
        << "  quit                        Exit\n";
}

void Console::cmd_write(Address addr, const std::vector<Word>& values) {
    if (AddressSpace::is_control(addr)) {
        for (Word v : values) {
            if (v > 0xFFFF) {
                out << "Value " << to_hex(v) << " does not fit a 16-bit register\n";
                return;
            }
        }
    }
    host.write_words(addr, values);
    out << "Wrote " << values.size() << " word(s) at " << to_hex(addr, 4) << "\n";
}

void Console::cmd_read(Address addr, int count) {
    int digits = AddressSpace::word_bytes(addr) * 2;
    std::vector<Word> words = host.read_words(addr, count);
    for (int i = 0; i < count; i++) {
        out << "  " << to_hex(static_cast<Address>(addr + i), 4) << ": "
            << to_hex(words[i], digits) << "\n";
    }
}

void Console::cmd_tx(const std::vector<Byte>& bytes) {
    std::vector<Byte> in = host.transfer(bytes);
    out << "RX:";
    for (Byte b : in) {
        out << " " << std::hex << std::uppercase << std::setw(2) << std::setfill('0')
            << static_cast<int>(b);
    }
    out << std::dec << std::setfill(' ') << "\n";
}

void Console::cmd_cs() {
    device.on_gpio(Adau1467::CHIP_SELECT_PIN, true);
    out << "Chip select released\n";
}

void Console::cmd_reset() {
    device.on_gpio(Adau1467::RESET_PIN, false);
    device.on_gpio(Adau1467::RESET_PIN, true);
    out << "Reset complete\n";
}

void Console::cmd_page(const std::string& page) {
    if (!page.empty()) {
        auto p = parse_page(page);
        if (!p || *p == PageOverride::CURRENT) return;
        host.write_word(adau_reg::SECONDPAGE_ENABLE, (*p == PageOverride::FORCE_B) ? 1 : 0);
    }
    out << "Page: " << page_name(device.get_page()) << "\n";
}

void Console::cmd_regs() {
    device.registers().dump(out);
}

void Console::cmd_reg(const std::string& name) {
    auto addr = device.registers().find(name);
    if (!addr) {
        auto v = parse_number(name);
        if (v && *v <= 0xFFFF && device.registers().contains(static_cast<Address>(*v))) {
            addr = static_cast<Address>(*v);
        }
    }

    if (addr) {
        device.registers().dump_reg(out, *addr);
    } else {
        out << "Unknown register: " << name << "\n";
    }
}

void Console::cmd_mem(Address addr, int count, PageOverride override) {
    device.memory().dump_words(out, addr, count, override);
}

void Console::cmd_safeload(Address target, const std::vector<Word>& values) {
    if (values.size() > SafeloadEngine::DATA_WORDS) {
        out << "At most " << SafeloadEngine::DATA_WORDS << " words per safeload\n";
        return;
    }

    // Staging goes to the current page; trigger the matching count register
    Address trigger = (device.get_page() == Page::A) ? SafeloadEngine::COUNT_LOWER
                                                     : SafeloadEngine::COUNT_UPPER;
    host.write_words(SafeloadEngine::DATA_BASE, values);
    host.write_word(SafeloadEngine::TARGET_ADDR, target);
    host.write_word(trigger, static_cast<Word>(values.size()));

    out << "Safeload P" << page_name(device.get_page()) << ": " << values.size()
        << " word(s) to " << to_hex(target, 4) << "\n";
}

void Console::cmd_savemem(const std::string& filename, Address addr, int count, Page page) {
    try {
        save_memory(device, filename, addr, count, page);
        out << "Saved " << count << " word(s) from " << to_hex(addr, 4)
            << " page " << page_name(page) << " to " << filename << "\n";
    } catch (const ExportError& e) {
        out << e.what() << "\n";
    }
}

void Console::cmd_saveregs(const std::string& filename) {
    try {
        save_registers(device.registers(), filename);
        out << "Saved " << device.registers().size() << " registers to " << filename << "\n";
    } catch (const ExportError& e) {
        out << e.what() << "\n";
    }
}

void Console::cmd_stats() {
    out << "Statistics:\n";
    out << "  Variant: " << device.get_variant() << "\n";
    out << "  Page: " << page_name(device.get_page()) << "\n";
    out << "  Transactions: " << device.decoder().get_transaction_count() << "\n";
    out << "  Bytes sent: " << host.get_byte_count() << "\n";
    out << "  Control reads: " << device.get_control_read_count() << "\n";
    out << "  Control writes: " << device.get_control_write_count() << "\n";
    out << "  Memory reads: " << device.memory().get_read_count() << "\n";
    out << "  Memory writes: " << device.memory().get_write_count() << "\n";
    out << "  Safeloads: " << device.safeload().get_commit_count()
        << " (" << device.safeload().get_word_count() << " words)\n";
    out << "  Resets: " << device.get_reset_count() << "\n";
    out << "  Warnings: " << log.count(LogLevel::Warning) << "\n";
    out << "  Errors: " << log.count(LogLevel::Error) << "\n";
}

void Console::cmd_loglevel(const std::string& level) {
    if (!level.empty()) {
        auto l = Logger::parse_level(level);
        if (!l) {
            out << "Unknown log level: " << level << "\n";
            return;
        }
        log.set_threshold(*l);
    }
    out << "Log level: " << Logger::level_name(log.get_threshold()) << "\n";
}

// =============================================================================
// Helpers
// =============================================================================

void Console::print_welcome() {
    out << "\n";
    out << device.get_variant() << " SPI model\n";
    out << "Type 'help' for commands\n";
    out << "\n";
}

void Console::print_prompt() {
    out << "[" << device.get_variant() << " P" << page_name(device.get_page()) << "] > ";
    out.flush();
}

std::optional<Address> Console::resolve_address(const std::string& str) {
    // Register names first
    auto reg = device.registers().find(str);
    if (reg) return reg;

    auto v = parse_number(str);
    if (!v || *v > 0xFFFF) {
        out << "Invalid address: " << str << "\n";
        return std::nullopt;
    }
    return static_cast<Address>(*v);
}

std::optional<Word> Console::parse_value(const std::string& str) {
    auto v = parse_number(str);
    if (!v) {
        out << "Invalid number: " << str << "\n";
    }
    return v;
}

std::optional<PageOverride> Console::parse_page(const std::string& str) {
    std::string p = str;
    std::transform(p.begin(), p.end(), p.begin(), ::tolower);

    if (p == "a" || p == "0" || p == "lower") return PageOverride::FORCE_A;
    if (p == "b" || p == "1" || p == "upper") return PageOverride::FORCE_B;
    out << "Invalid page: " << str << " (use a or b)\n";
    return std::nullopt;
}

std::vector<std::string> Console::tokenize(const std::string& input) {
    std::vector<std::string> tokens;
    std::istringstream ss(input);
    std::string token;
    while (ss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}
