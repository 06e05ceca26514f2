#include "mork/reader.h"
#include "parser/parser.h"
#include "posix_file.h"
#include "scanner/scanner.h"
#include "utils/logging.h"

namespace Mork {

auto Reader::read(const Slice &filename, const Slice &input, const Options &options, TableMap &out) -> Status
{
    System system {options};
    auto log = system.create_log("reader");
    log->info("reading {} ({} bytes)", filename.to_view(), input.size());

    Scanner scanner {input, system.create_log("scanner")};
    Parser parser {filename.to_string(), scanner, options, system.create_log("parser")};

    const auto before = out.size();
    auto s = parser.parse(out);
    if (s.is_ok()) {
        log->info("finished {}: {} tables", filename.to_view(), out.size() - before);
    } else {
        log->error("stopped reading {}: {}", filename.to_view(), s.what().to_view());
    }
    return s;
}

auto Reader::read_file(const std::string &path, const Options &options, TableMap &out) -> Status
{
    std::string contents;
    MORK_TRY_S(read_contents(path, contents));
    return read(path, contents, options, out);
}

auto Reader::tokenize(const Slice &filename, const Slice &input, std::vector<TokenRecord> &out) -> Status
{
    Scanner scanner {input};
    for (; ; ) {
        const auto token = scanner.next_token();
        if (token.type == TokenType::ERROR) {
            return Status::lexical_error(fmt::format("{}: syntax error: {} at {}:{}",
                                                     filename.to_view(),
                                                     token.text.to_view(),
                                                     token.position.line,
                                                     token.position.column));
        }
        out.push_back({token_type_name(token.type), token.text.to_string(), token.position.line, token.position.column});
        if (token.type == TokenType::END_OF_INPUT)
            return Status::ok();
    }
}

auto Reader::read_contents(const std::string &path, std::string &out) -> Status
{
    return read_whole_file(path, out);
}

} // namespace Mork
