//===----------------------------------------------------------------------===//
//
// Part of the movetext project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the reusable pipeline behind the `movetext-parse` executable.
// Inline text is parsed once; a file is parsed line by line so a batch of
// type tags or arguments can be checked in one run.  Failures are collected in
// a DiagnosticEngine and printed after all inputs so the output block and the
// diagnostic block never interleave.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements command-line handling and rendering for `movetext-parse`.

#include "tools/movetext-parse/driver.hpp"

#include "io/Lexer.hpp"
#include "movetext/io/TextParse.hpp"
#include "support/char_utils.hpp"
#include "tools/common/source_loader.hpp"

#include <algorithm>
#include <ostream>
#include <utility>

namespace movetext::tools::textparse
{

using support::Expected;
using support::ParseMode;

namespace
{

struct ModeFlag
{
    std::string_view flag;
    ParseMode mode;
};

constexpr ModeFlag kModeFlags[] = {
    {"--type-tag", ParseMode::TypeTag},
    {"--type-tags", ParseMode::TypeTags},
    {"--struct-tag", ParseMode::StructTag},
    {"--arg", ParseMode::Argument},
    {"--args", ParseMode::Arguments},
    {"--names", ParseMode::Names},
    {"--tokens", ParseMode::Tokens},
};

void printUsage(std::ostream &err)
{
    err << "Usage: movetext-parse [--trace] <mode> <text>\n"
           "       movetext-parse [--trace] <mode> --file <path>\n"
           "       movetext-parse --version\n"
           "Modes: --type-tag --type-tags --struct-tag --arg --args --names --tokens\n";
}

template <class T, class Render>
Expected<std::vector<std::string>> renderAll(Expected<std::vector<T>> items, Render render)
{
    if (!items)
        return std::move(items).error();
    std::vector<std::string> lines;
    lines.reserve(items.value().size());
    for (const auto &item : items.value())
        lines.push_back(render(item));
    return lines;
}

template <class T> Expected<std::vector<std::string>> renderOne(Expected<T> item)
{
    if (!item)
        return std::move(item).error();
    return std::vector<std::string>{core::toString(item.value())};
}

/// @brief One line per token: `<line>:<column> <kind> [<text>]`.
Expected<std::vector<std::string>> dumpTokens(std::string_view text)
{
    auto tokens = io::tokenize(text);
    if (!tokens)
        return std::move(tokens).error();
    std::vector<std::string> lines;
    for (const io::Token &tok : tokens.value())
    {
        std::string line = std::to_string(tok.loc.line) + ":" + std::to_string(tok.loc.column) +
                           " " + io::tokenKindToString(tok.kind);
        if (!tok.text.empty() && !tok.is(io::TokenKind::Whitespace))
            line += " " + tok.text;
        lines.push_back(std::move(line));
    }
    return lines;
}

bool isBlank(std::string_view line)
{
    return std::all_of(line.begin(), line.end(), support::char_utils::isWhitespace);
}

/// @brief Parse one input, print its result or record its diagnostic.
void processInput(const support::Options &opts,
                  std::string_view text,
                  support::SourceLoc origin,
                  std::ostream &out,
                  support::DiagnosticEngine &de)
{
    if (opts.trace)
        out << "> " << text << '\n';

    auto rendered = renderInput(opts.mode, text);
    if (!rendered)
    {
        support::Diag diag = std::move(rendered).error();
        if (origin.isValid())
        {
            diag.loc.file_id = origin.file_id;
            diag.loc.line = origin.line;
        }
        de.report(std::move(diag));
        return;
    }
    for (const auto &line : rendered.value())
        out << line << '\n';
}

} // namespace

Expected<support::Options> parseCommandLine(ArgvView args)
{
    support::Options opts;
    bool haveText = false;
    for (int i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args.at(i);
        if (arg == "--trace")
        {
            opts.trace = true;
            continue;
        }
        if (arg == "--file")
        {
            if (i + 1 >= args.size())
                return support::makeError({}, "--file requires a path");
            opts.file = std::string(args.at(++i));
            continue;
        }
        auto flag = std::find_if(std::begin(kModeFlags),
                                 std::end(kModeFlags),
                                 [arg](const ModeFlag &m) { return m.flag == arg; });
        if (flag != std::end(kModeFlags))
        {
            if (opts.mode != ParseMode::None)
                return support::makeError({}, "only one mode may be given");
            opts.mode = flag->mode;
            continue;
        }
        if (arg.substr(0, 2) == "--")
            return support::makeError({}, "unknown option '" + std::string(arg) + "'");
        if (haveText)
            return support::makeError({}, "unexpected argument '" + std::string(arg) + "'");
        opts.text = std::string(arg);
        haveText = true;
    }

    if (opts.mode == ParseMode::None)
        return support::makeError({}, "no mode given");
    if (haveText == !opts.file.empty())
        return support::makeError({}, "expected exactly one of <text> or --file <path>");
    return opts;
}

Expected<std::vector<std::string>> renderInput(ParseMode mode, std::string_view text)
{
    auto render = [](const auto &item) { return core::toString(item); };
    switch (mode)
    {
        case ParseMode::TypeTag:
            return renderOne(io::parseTypeTag(text));
        case ParseMode::TypeTags:
            return renderAll(io::parseTypeTags(text), render);
        case ParseMode::StructTag:
            return renderOne(io::parseStructTag(text));
        case ParseMode::Argument:
            return renderOne(io::parseTransactionArgument(text));
        case ParseMode::Arguments:
            return renderAll(io::parseTransactionArguments(text), render);
        case ParseMode::Names:
            return renderAll(io::parseStringList(text), [](const std::string &s) { return s; });
        case ParseMode::Tokens:
            return dumpTokens(text);
        case ParseMode::None:
            break;
    }
    return support::makeError({}, "no mode given");
}

int runCLI(int argc, char **argv, std::ostream &out, std::ostream &err, support::SourceManager &sm)
{
    ArgvView args = ArgvView{argc, argv}.drop_front();
    if (args.size() == 1 && args.at(0) == "--version")
    {
        out << kVersionBanner << '\n';
        return kExitOk;
    }

    auto opts = parseCommandLine(args);
    if (!opts)
    {
        support::printDiag(opts.error(), err);
        printUsage(err);
        return kExitUsage;
    }

    support::DiagnosticEngine de;
    if (opts.value().file.empty())
    {
        processInput(opts.value(), opts.value().text, {}, out, de);
    }
    else
    {
        auto source = common::loadSourceBuffer(opts.value().file, sm);
        if (!source)
        {
            support::printDiag(source.error(), err);
            return kExitUsage;
        }

        std::string_view buffer = source.value().buffer;
        uint32_t lineNo = 0;
        while (!buffer.empty())
        {
            ++lineNo;
            const auto eol = buffer.find('\n');
            std::string_view line = buffer.substr(0, eol);
            buffer = eol == std::string_view::npos ? std::string_view{} : buffer.substr(eol + 1);
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            if (isBlank(line))
                continue;
            const support::SourceLoc origin{source.value().fileId, lineNo, 0};
            processInput(opts.value(), line, origin, out, de);
        }
    }

    de.printAll(err, &sm);
    return de.errorCount() == 0 ? kExitOk : kExitParseFailure;
}

} // namespace movetext::tools::textparse
