/**
 * @file shell.cpp
 * @brief Implementation of the interactive catalog menu
 */

#include "shell.hpp"
#include "logging.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace realty {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

std::string format_amount(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // namespace

//=============================================================================
// Input parsing
//=============================================================================

std::optional<double> parse_number(std::string_view text) {
    std::string_view token = trim(text);
    if (!token.empty() && token.front() == '+') {
        token.remove_prefix(1);
        if (!token.empty() && token.front() == '-') {
            return std::nullopt;
        }
    }
    if (token.empty()) {
        return std::nullopt;
    }

    // Locale-independent; hex floats such as "0x10" are rejected.
    double value = 0.0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value,
                                     std::chars_format::general);
    if (ec != std::errc() || ptr != token.data() + token.size() || !std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::optional<double> parse_price(std::string_view text) {
    auto value = parse_number(text);
    if (!value || *value < 0.0) {
        return std::nullopt;
    }
    return value;
}

std::optional<RecordId> parse_record_id(std::string_view text) {
    std::string_view token = trim(text);
    if (token.empty()) {
        return std::nullopt;
    }

    RecordId id = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), id);
    if (ec != std::errc() || ptr != token.data() + token.size()) {
        return std::nullopt;
    }
    return id;
}

//=============================================================================
// Rendering
//=============================================================================

void render_table(std::ostream& out, std::span<const Record> records) {
    out << std::left
        << std::setw(5) << "ID" << ' '
        << std::setw(20) << "Title" << ' '
        << std::setw(15) << "Location" << ' '
        << std::setw(10) << "Price" << ' '
        << std::setw(10) << "Type" << '\n';
    out << std::string(65, '-') << '\n';

    for (const auto& record : records) {
        out << std::setw(5) << record.id() << ' '
            << std::setw(20) << record.title() << ' '
            << std::setw(15) << record.location() << ' '
            << '$' << std::setw(9) << format_amount(record.price()) << ' '
            << std::setw(10) << record.category() << '\n';
    }
    out << std::right;
}

void render_json(std::ostream& out, std::span<const Record> records) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& record : records) {
        array.push_back(record.to_json());
    }
    out << array.dump(2) << '\n';
}

//=============================================================================
// Shell
//=============================================================================

Shell::Shell(CatalogEngine& engine, std::istream& in, std::ostream& out, OutputFormat format)
    : engine_(engine)
    , in_(in)
    , out_(out)
    , format_(format)
{
}

void Shell::run() {
    REALTY_LOG_DEBUG("Shell", "Session started with ", engine_.size(), " listings");
    while (step()) {
    }
    REALTY_LOG_DEBUG("Shell", "Session ended with ", engine_.size(), " listings");
}

bool Shell::read_line(std::string_view prompt, std::string& line) {
    out_ << prompt << std::flush;
    if (!std::getline(in_, line)) {
        out_ << '\n';
        return false;
    }
    return true;
}

void Shell::render(std::span<const Record> records) {
    if (format_ == OutputFormat::JSON) {
        render_json(out_, records);
    } else {
        render_table(out_, records);
    }
}

bool Shell::step() {
    out_ << "\n=== WELCOME TO GLOBAL REAL ESTATES - PROPERTY LISTING ENGINE ===\n"
         << "1. Add Property\n"
         << "2. Delete Property\n"
         << "3. Search by Location\n"
         << "4. Search by Price Range\n"
         << "5. Sort Properties by Price\n"
         << "6. Display All Properties\n"
         << "7. Exit\n";

    std::string choice;
    if (!read_line("\nEnter your choice (1-7): ", choice)) {
        return false;
    }

    std::string_view selected = trim(choice);
    if (selected == "1") return handle_add();
    if (selected == "2") return handle_delete();
    if (selected == "3") return handle_search_location();
    if (selected == "4") return handle_search_price();
    if (selected == "5") return handle_sort();
    if (selected == "6") {
        handle_list();
        return true;
    }
    if (selected == "7") {
        out_ << "Thank you for using Global Real Estates Property Listing Engine. Goodbye!\n";
        return false;
    }

    out_ << "Invalid choice. Please try again.\n";
    return true;
}

bool Shell::handle_add() {
    std::string title;
    std::string location;
    std::string category;
    std::string line;

    if (!read_line("Enter property title: ", title)) return false;
    if (!read_line("Enter location: ", location)) return false;

    std::optional<double> price;
    while (!price) {
        if (!read_line("Enter price: $", line)) return false;

        price = parse_price(line);
        if (price) {
            break;
        }
        if (parse_number(line)) {
            out_ << "Price cannot be negative. Please try again.\n";
        } else {
            out_ << "Invalid price. Please enter a number.\n";
        }
    }

    if (!read_line("Enter property type (apartment, house, plot, etc.): ", category)) return false;

    RecordId id = engine_.add(std::move(title), std::move(location), *price, std::move(category));
    out_ << "Property added successfully with ID: " << id << '\n';
    return true;
}

bool Shell::handle_delete() {
    std::string line;
    if (!read_line("Enter property ID to delete: ", line)) return false;

    auto id = parse_record_id(line);
    if (!id) {
        // A negative integer is well formed but can never name a listing.
        std::string_view token = trim(line);
        if (token.size() > 1 && token.front() == '-' && parse_record_id(token.substr(1))) {
            out_ << "Property with ID " << token << " not found.\n";
        } else {
            out_ << "Invalid ID. Please enter a number.\n";
        }
        return true;
    }

    if (engine_.remove(*id)) {
        out_ << "Property with ID " << *id << " deleted successfully.\n";
    } else {
        out_ << "Property with ID " << *id << " not found.\n";
    }
    return true;
}

bool Shell::handle_search_location() {
    std::string location;
    if (!read_line("Enter location to search: ", location)) return false;

    auto results = engine_.search_by_location(location);
    if (results.empty()) {
        out_ << "No properties found in " << location << ".\n";
        return true;
    }

    out_ << "\nFound " << results.size() << " properties in " << location << ":\n";
    render(results);
    return true;
}

bool Shell::handle_search_price() {
    std::string min_line;
    std::string max_line;
    if (!read_line("Enter minimum price: $", min_line)) return false;

    auto min_price = parse_number(min_line);
    if (!min_price) {
        out_ << "Invalid price. Please enter a number.\n";
        return true;
    }

    if (!read_line("Enter maximum price: $", max_line)) return false;

    auto max_price = parse_number(max_line);
    if (!max_price) {
        out_ << "Invalid price. Please enter a number.\n";
        return true;
    }

    if (*min_price > *max_price) {
        out_ << "Minimum price cannot be greater than maximum price.\n";
        return true;
    }

    auto results = engine_.search_by_price_range(*min_price, *max_price);
    std::string range = "$" + format_amount(*min_price) + " and $" + format_amount(*max_price);
    if (results.empty()) {
        out_ << "No properties found between " << range << ".\n";
        return true;
    }

    out_ << "\nFound " << results.size() << " properties between " << range << ":\n";
    render(results);
    return true;
}

bool Shell::handle_sort() {
    std::string line;
    if (!read_line("Sort by price (A)scending or (D)escending? ", line)) return false;

    std::string_view answer = trim(line);
    if (answer != "A" && answer != "a" && answer != "D" && answer != "d") {
        out_ << "Invalid choice. Please enter 'A' or 'D'.\n";
        return true;
    }

    bool ascending = (answer == "A" || answer == "a");
    auto sorted = engine_.sort_by_price(ascending ? SortOrder::ASCENDING : SortOrder::DESCENDING);
    if (sorted.empty()) {
        out_ << "No properties to sort.\n";
        return true;
    }

    out_ << "\nProperties sorted by price (" << (ascending ? "ascending" : "descending") << "):\n";
    render(sorted);
    return true;
}

void Shell::handle_list() {
    auto records = engine_.list_all();
    if (records.empty()) {
        out_ << "No properties found.\n";
        return;
    }

    out_ << "\nAll Properties (" << records.size() << "):\n";
    render(records);
}

} // namespace realty
