#include <algorithm>
#include <charconv>
#include <iostream>
#include <memory_resource>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "common/ansi.hpp"
#include "common/assert.hpp"
#include "common/code_string.hpp"
#include "common/diagnostics.hpp"
#include "common/io.hpp"
#include "common/parse.hpp"
#include "common/tty.hpp"

#include "surf/diagnostic.hpp"
#include "surf/parsing/parse.hpp"
#include "surf/render/html.hpp"
#include "surf/render/markdown.hpp"
#include "surf/render/render_config.hpp"
#include "surf/render/terminal.hpp"
#include "surf/site/site.hpp"

#include "md4c/md4c_engine.hpp"

#include "cli/front_matter.hpp"

namespace surfdoc {
namespace {

struct Options {
    std::optional<bool> colors;
    Theme theme = Theme::light;
    bool omit_css = false;
    bool full_page = false;
    std::optional<std::string_view> out;
    Size jobs = 0;
    Size max_pages = 0;
    Size width = 80;
    std::vector<Diagnostic_Code> ignored;

    [[nodiscard]] bool stdout_colors() const
    {
        return colors.value_or(is_stdout_tty);
    }

    [[nodiscard]] bool stderr_colors() const
    {
        return colors.value_or(is_stderr_tty);
    }

    [[nodiscard]] Render_Config render_config(std::string_view file) const
    {
        Render_Config result;
        result.theme = theme;
        result.colors = stdout_colors();
        result.stylesheet = omit_css ? Stylesheet_Mode::omit : Stylesheet_Mode::inline_css;
        result.full_page = full_page;
        result.source_path = std::string(file);
        result.terminal_width = width;
        result.max_pages = max_pages;
        result.worker_count = jobs;
        return result;
    }
};

void print_error(std::string_view message, std::string_view detail, bool colors)
{
    Code_String out;
    out.append("Error: ", Code_Span_Type::diagnostic_error);
    out.append(message, Code_Span_Type::diagnostic_text);
    if (!detail.empty()) {
        out.append(" '", Code_Span_Type::diagnostic_punctuation);
        out.append(detail, Code_Span_Type::diagnostic_code_citation);
        out.append('\'', Code_Span_Type::diagnostic_punctuation);
    }
    out.append('\n');
    print_code_string(std::cerr, out, colors);
}

std::optional<Size> parse_count(std::string_view text)
{
    Size result = 0;
    const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc {} || p != text.data() + text.size()) {
        return {};
    }
    return result;
}

/// @brief Parses `--ignore=SD014,code_language_missing`.
bool parse_ignored_codes(std::vector<Diagnostic_Code>& out, std::string_view list)
{
    while (!list.empty()) {
        const Size comma = list.find(',');
        const std::string_view name = trim(list.substr(0, comma));
        list = comma == std::string_view::npos ? std::string_view {} : list.substr(comma + 1);
        if (name.empty()) {
            continue;
        }
        const std::optional<Diagnostic_Code> code = diagnostic_code_by_name(name);
        if (!code) {
            print_error("unknown diagnostic", name, is_stderr_tty);
            return false;
        }
        out.push_back(*code);
    }
    return true;
}

std::optional<Options> parse_options(std::span<const std::string_view> args)
{
    Options result;
    for (const std::string_view arg : args) {
        const Size equals = arg.find('=');
        const std::string_view name = arg.substr(0, equals);
        const std::string_view value
            = equals == std::string_view::npos ? std::string_view {} : arg.substr(equals + 1);

        if (arg == "--no-color") {
            result.colors = false;
        }
        else if (arg == "--color") {
            result.colors = true;
        }
        else if (arg == "--no-css") {
            result.omit_css = true;
        }
        else if (arg == "--page") {
            result.full_page = true;
        }
        else if (name == "--theme") {
            const std::optional<Theme> theme = theme_by_name(value);
            if (!theme) {
                print_error("unknown theme", value, is_stderr_tty);
                return {};
            }
            result.theme = *theme;
        }
        else if (name == "--out" && !value.empty()) {
            result.out = value;
        }
        else if (name == "--jobs" || name == "--max-pages" || name == "--width") {
            const std::optional<Size> count = parse_count(value);
            if (!count) {
                print_error("expected a non-negative integer, but got", arg, is_stderr_tty);
                return {};
            }
            Size& target = name == "--jobs" ? result.jobs
                : name == "--max-pages"      ? result.max_pages
                                             : result.width;
            target = *count;
        }
        else if (name == "--ignore") {
            if (!parse_ignored_codes(result.ignored, value)) {
                return {};
            }
        }
        else {
            print_error("unrecognized option", arg, is_stderr_tty);
            return {};
        }
    }
    return result;
}

struct Loaded_Document {
    /// @brief The source with front matter lines blanked out, so that diagnostic positions are
    /// positions within the file.
    std::string source;
    Parsed_Document parsed;
};

std::optional<Loaded_Document>
load_document(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const Result<std::pmr::vector<char>, IO_Error_Code> bytes = file_to_bytes(file, memory);
    if (!bytes) {
        Code_String out;
        print_io_error(out, file, bytes.error());
        print_code_string(std::cerr, out, options.stderr_colors());
        return {};
    }

    Split_Document split = split_front_matter({ bytes->data(), bytes->size() });
    Loaded_Document result { .source = std::move(split.body), .parsed = {} };
    result.parsed = parse(result.source, std::move(split.front_matter));

    std::erase_if(result.parsed.diagnostics, [&](const Diagnostic& d) {
        return std::ranges::find(options.ignored, d.code) != options.ignored.end();
    });
    return result;
}

void print_diagnostics(Code_String& out, std::string_view file, const Loaded_Document& document)
{
    for (const Diagnostic& d : document.parsed.diagnostics) {
        print_diagnostic(out, file, document.source, d);
    }
}

/// @brief Prints the diagnostics of a document which is rendered anyway.
void report_to_stderr(std::string_view file, const Loaded_Document& document, const Options& options)
{
    if (document.parsed.diagnostics.empty()) {
        return;
    }
    Code_String out;
    print_diagnostics(out, file, document);
    print_diagnostic_summary(out, document.parsed.diagnostics);
    print_code_string(std::cerr, out, options.stderr_colors());
}

/// @brief Writes `text` to the `--out` file, or to stdout.
int emit(std::string_view text, const Options& options)
{
    if (!options.out) {
        std::cout << text;
        return std::cout ? 0 : 1;
    }
    if (const Result<void, IO_Error_Code> r = bytes_to_file(*options.out, text); !r) {
        Code_String out;
        print_io_error(out, *options.out, r.error());
        print_code_string(std::cerr, out, options.stderr_colors());
        return 1;
    }
    return 0;
}

int check(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    const std::vector<Diagnostic>& diagnostics = document->parsed.diagnostics;

    Code_String out;
    if (diagnostics.empty()) {
        out.append("All checks passed.\n", Code_Span_Type::diagnostic_text);
    }
    else {
        print_diagnostics(out, file, *document);
        print_diagnostic_summary(out, diagnostics);
    }
    print_code_string(std::cout, out, options.stdout_colors());
    return has_errors(diagnostics) ? 1 : 0;
}

int dump_ast(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    Code_String out;
    print_ast(out, document->parsed.document, { .indent_width = 2, .max_node_text_length = 30 });
    print_code_string(std::cout, out, options.stdout_colors());
    return 0;
}

int to_html(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    report_to_stderr(file, *document, options);

    const MD4C_Markdown_Engine engine;
    Code_String html;
    render_html(html, document->parsed.document, options.render_config(file), engine);

    if (options.out) {
        return emit(html.get_text(), options);
    }
    // On a terminal, the markup is highlighted.
    print_code_string(std::cout, html, options.stdout_colors());
    return std::cout ? 0 : 1;
}

int to_markdown(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    report_to_stderr(file, *document, options);
    return emit(render_markdown(document->parsed.document, options.render_config(file)), options);
}

int to_terminal(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    report_to_stderr(file, *document, options);

    Code_String out;
    render_terminal(out, document->parsed.document, options.render_config(file));
    print_code_string(std::cout, out, options.stdout_colors());
    return std::cout ? 0 : 1;
}

int build_site(std::string_view file, const Options& options, std::pmr::memory_resource* memory)
{
    const std::optional<Loaded_Document> document = load_document(file, options, memory);
    if (!document) {
        return 1;
    }
    // A site is published as a whole, so it must not be published with known errors.
    if (has_errors(document->parsed.diagnostics)) {
        report_to_stderr(file, *document, options);
        print_error("the site was not built because the document has errors", {},
                    options.stderr_colors());
        return 1;
    }
    report_to_stderr(file, *document, options);

    const MD4C_Markdown_Engine engine;
    const Rendered_Site site
        = render_site(document->parsed.document, options.render_config(file), engine);
    if (site.pages.empty()) {
        print_error("the document contains no site with pages", {}, options.stderr_colors());
        return 1;
    }

    std::string directory { options.out.value_or("site") };
    if (!directory.ends_with('/')) {
        directory += '/';
    }
    for (const Rendered_Page& page : site.pages) {
        const std::string path = directory + page.path;
        if (const Result<void, IO_Error_Code> r = bytes_to_file(path, page.html); !r) {
            Code_String out;
            print_io_error(out, path, r.error());
            print_code_string(std::cerr, out, options.stderr_colors());
            return 1;
        }
    }

    Code_String out;
    out.append("Wrote ", Code_Span_Type::diagnostic_text);
    out.append_integer(site.pages.size(), Code_Span_Type::diagnostic_code_position);
    out.append(site.pages.size() == 1 ? " page to " : " pages to ",
               Code_Span_Type::diagnostic_text);
    out.append(directory, Code_Span_Type::diagnostic_code_position);
    out.append('\n');
    print_code_string(std::cout, out, options.stdout_colors());
    return 0;
}

struct Command_Help {
    std::string_view name;
    std::string_view arguments;
    std::string_view description;
};

constexpr Command_Help command_helps[] {
    { "check", "FILE", "Prints all diagnostics. Fails if there are errors." },
    { "dump_ast", "FILE", "Prints the block tree of the document." },
    { "html", "FILE [--out=FILE] [--page] [--no-css] [--theme=light|dark]",
      "Converts the document to HTML, as a fragment or (--page) a complete page." },
    { "markdown", "FILE [--out=FILE]", "Converts the document to plain markdown." },
    { "term", "FILE [--width=N]", "Renders the document for the terminal." },
    { "site", "FILE [--out=DIR] [--jobs=N] [--max-pages=N]",
      "Writes one HTML file per page of the site block, to 'site/' by default." },
    { "help", "", "Prints this message." },
};

void print_help(std::string_view program_name)
{
    std::cout << ansi::black << "Usage: " << ansi::reset << program_name //
              << ansi::yellow << " COMMAND " //
              << ansi::h_green << "...\n";
    for (const Command_Help& help : command_helps) {
        std::cout << "    " << ansi::yellow << help.name << " " //
                  << ansi::h_green << help.arguments << '\n' //
                  << "      " << ansi::reset << help.description << '\n';
    }
    std::cout << ansi::reset << "Common options: --color, --no-color, "
              << "--ignore=SD014,alt_text_missing,...\n";
}

using Command = int(std::string_view, const Options&, std::pmr::memory_resource*);

struct Command_Entry {
    std::string_view name;
    Command* command;
};

constexpr Command_Entry commands[] {
    { "check", check },          { "dump_ast", dump_ast },  { "html", to_html },
    { "markdown", to_markdown }, { "term", to_terminal },   { "site", build_site },
};

int main(int argc, const char** argv)
try {
    const std::vector<std::string_view> args(argv, argv + argc);
    const std::string_view program_name = args.size() == 0 ? "surfdoc" : args[0];

    if (args.size() == 2 && args[1] == "help") {
        print_help(program_name);
        return 0;
    }
    if (args.size() < 3) {
        print_help(program_name);
        return 1;
    }

    const auto* const entry
        = std::ranges::find(commands, args[1], &Command_Entry::name);
    if (entry == std::ranges::end(commands)) {
        print_error("unknown command", args[1], is_stderr_tty);
        return 1;
    }

    const std::optional<Options> options = parse_options(std::span(args).subspan(3));
    if (!options) {
        return 1;
    }

    std::pmr::unsynchronized_pool_resource memory;
    return entry->command(args[2], *options, &memory);
} catch (const Assertion_Error& e) {
    surfdoc::Code_String out;
    print_assertion_error(out, e);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
} catch (std::exception& e) {
    surfdoc::Code_String out;
    out.append("Unhandled exception! ", surfdoc::Code_Span_Type::diagnostic_error_text);
    out.append("An exception with the following message has been raised:",
               surfdoc::Code_Span_Type::diagnostic_text);
    out.append("\n\n");
    out.append(e.what(), surfdoc::Code_Span_Type::diagnostic_text);
    print_internal_error_notice(out);
    print_code_string(std::cerr, out, is_stderr_tty);
    return 1;
}

} // namespace
} // namespace surfdoc

int main(int argc, const char** argv)
{
    return surfdoc::main(argc, argv);
}
