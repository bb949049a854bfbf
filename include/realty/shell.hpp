/**
 * @file shell.hpp
 * @brief Interactive menu over a CatalogEngine
 *
 * The shell validates everything it reads before calling the engine.
 * Parsers return std::nullopt on malformed input and the menu handlers
 * re-prompt or report and return to the menu.
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "catalog_engine.hpp"
#include "record.hpp"

namespace realty {

enum class OutputFormat : uint8_t {
    TABLE = 0,
    JSON = 1,
};

//=============================================================================
// Input parsing
//=============================================================================

/**
 * Parse a finite decimal number, surrounding whitespace and one leading '+'
 * allowed. Hexadecimal forms, "inf" and "nan" are rejected.
 */
std::optional<double> parse_number(std::string_view text);

/**
 * parse_number() restricted to values >= 0.
 */
std::optional<double> parse_price(std::string_view text);

/**
 * Parse an unsigned decimal id, surrounding whitespace allowed.
 */
std::optional<RecordId> parse_record_id(std::string_view text);

//=============================================================================
// Rendering
//=============================================================================

/**
 * Fixed-width table: ID, Title, Location, Price, Type.
 */
void render_table(std::ostream& out, std::span<const Record> records);

/**
 * Pretty-printed JSON array of record objects.
 */
void render_json(std::ostream& out, std::span<const Record> records);

//=============================================================================
// Shell
//=============================================================================

class Shell {
public:
    Shell(CatalogEngine& engine, std::istream& in, std::ostream& out,
          OutputFormat format = OutputFormat::TABLE);

    /**
     * Run the menu until the user exits or input ends.
     */
    void run();

    /**
     * Show the menu and handle one choice.
     * @return false once the user chose Exit or input ended
     */
    bool step();

private:
    bool read_line(std::string_view prompt, std::string& line);
    void render(std::span<const Record> records);

    bool handle_add();
    bool handle_delete();
    bool handle_search_location();
    bool handle_search_price();
    bool handle_sort();
    void handle_list();

    CatalogEngine& engine_;
    std::istream& in_;
    std::ostream& out_;
    OutputFormat format_;
};

} // namespace realty
