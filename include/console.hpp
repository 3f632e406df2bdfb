/**
 * console.hpp
 *
 * Interactive front end.
 * Drives an ADAU1467 model over SPI and exposes its registers and memory.
 */

#ifndef CONSOLE_HPP
#define CONSOLE_HPP

#include "common.hpp"
#include "log.hpp"
#include "adau1467.hpp"
#include "spi_host.hpp"

class Console {
public:
    Console(Adau1467& device, Logger& log, std::ostream& out = std::cout, Byte chip_address = 0x00);

    // Execute commands from a script file
    bool source(const std::string& filename);

    // Run the command loop on the given input
    void run(std::istream& in = std::cin);

    // Execute a single command, returns false to quit
    bool execute_command(const std::string& input);

private:
    Adau1467& device;
    Logger& log;
    std::ostream& out;
    SpiHost host;
    bool running;
    int source_depth;

    // Command handlers
    void cmd_help();
    void cmd_write(Address addr, const std::vector<Word>& values);
    void cmd_read(Address addr, int count);
    void cmd_tx(const std::vector<Byte>& bytes);
    void cmd_cs();
    void cmd_reset();
    void cmd_page(const std::string& page);
    void cmd_regs();
    void cmd_reg(const std::string& name);
    void cmd_mem(Address addr, int count, PageOverride override);
    void cmd_safeload(Address target, const std::vector<Word>& values);
    void cmd_savemem(const std::string& filename, Address addr, int count, Page page);
    void cmd_saveregs(const std::string& filename);
    void cmd_stats();
    void cmd_loglevel(const std::string& level);

    // Helpers
    void print_welcome();
    void print_prompt();
    std::optional<Address> resolve_address(const std::string& str);
    std::optional<Word> parse_value(const std::string& str);
    std::optional<PageOverride> parse_page(const std::string& str);
    std::vector<std::string> tokenize(const std::string& input);
};

#endif // CONSOLE_HPP
