#ifndef CCOUNT_PRINTERS_HPP
#define CCOUNT_PRINTERS_HPP

#include <ostream>
#include <stdexcept>
#include <string>
#include "nlohmann/json.hpp"
#include "ccount/frequency_counter.hpp"


namespace ccount {

struct tsv_count_printer {
    explicit tsv_count_printer(std::ostream& os, bool show_header = false)
        : os_(os), show_header_(show_header)
    {}

    void print_header() {
        if (show_header_) {
            os_ << "string"
                << "\t" << "count"
                << "\n";
        }
    }

    void print_footer() {
        os_.flush();
        if (!os_)  throw std::runtime_error("Failed to write counts.");
    }

    void print(const std::string& s, const count_type count) {
        os_ << s << "\t" << count << "\n";
    }

private:
    std::ostream& os_;
    bool show_header_;
};

struct json_lines_count_printer {
    explicit json_lines_count_printer(std::ostream& os)
        : os_(os)
    {}

    void print_header() {}

    void print_footer() {
        os_.flush();
        if (!os_)  throw std::runtime_error("Failed to write counts.");
    }

    void print(const std::string& s, const count_type count) {
        nlohmann::json j;
        j["string"] = s;
        j["count"]  = count;
        os_ << j.dump() << "\n";
    }

private:
    std::ostream& os_;
};

// Writes a whole ranked list through a printer.
template <class ResultPrinter, class Entries>
void print_all(ResultPrinter& printer, const Entries& entries) {
    printer.print_header();
    for (const auto& e : entries) {
        printer.print(e.first, e.second);
    }
    printer.print_footer();
}

}  // namespace ccount


#endif  /* CCOUNT_PRINTERS_HPP */
