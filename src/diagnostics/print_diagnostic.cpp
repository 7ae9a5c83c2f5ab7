#include "trebuchet/diagnostics/diagnostic.h"
#include <ostream>
#include <string_view>

namespace trebuchet::diagnostics {
    // ANSI fragments
    static constexpr std::string_view kRed = "\033[31m";
    static constexpr std::string_view kBold = "\033[1m";
    static constexpr std::string_view kReset = "\033[0m";

    static void print_header(std::ostream &out, const Diagnostic &diag, const bool color) {
        if (diag.file.empty()) { return; }
        if (color) { out << kBold; }
        out << diag.file << ':' << diag.line << ':' << diag.col << ": ";
        if (color) { out << kReset; }
    }

    static void print_label(std::ostream &out, const bool color) {
        if (color) {
            out << kRed << "error: " << kReset;
        } else { out << "error: "; }
    }

    static void print_source_with_caret(std::ostream &out, const Diagnostic &diag) {
        if (diag.line <= 0 || diag.col <= 0) { return; }
        out << "  " << diag.source_line << '\n';
        out << "  ";
        for (int i = 1; i < diag.col; ++i) { out << ' '; }
        out << "^\n";
    }

    void PrintDiagnostic(std::ostream &out, const Diagnostic &diag, const bool color) {
        print_header(out, diag, color);
        print_label(out, color);
        out << diag.message << '\n';
        print_source_with_caret(out, diag);
    }
} // namespace trebuchet::diagnostics
