#include "board_parser.hpp"
#include "parser.hpp"
#include <cstdio>
#include <memory>
#include <stdexcept>
#include <utility>

namespace mine_prob {
namespace text {

namespace {

/**
 * @brief 再入可能スキャナの所有者
 *
 * yylex_destroy はバッファスタックごと解放するので、
 * yy_scan_string で作ったバッファもここで消える。
 */
class Scanner {
public:
    Scanner() {
        if (yylex_init(&scanner_) != 0) {
            throw std::runtime_error("Cannot initialise the scanner");
        }
    }
    ~Scanner() { yylex_destroy(scanner_); }

    Scanner(const Scanner&) = delete;
    Scanner& operator=(const Scanner&) = delete;

    yyscan_t get() const { return scanner_; }

    /**
     * @brief 設定済みの入力を最後まで読む
     * @throws std::runtime_error 構文エラー、または行が1つもない
     */
    BoardFile parse() {
        ParserContext ctx;
        int result = yyparse(scanner_, &ctx);
        if (result != 0 || ctx.has_error) {
            throw std::runtime_error("Parse error: " + ctx.error_message);
        }
        if (ctx.file.rows().empty()) {
            throw std::runtime_error("Parse error: board has no rows");
        }
        return std::move(ctx.file);
    }

private:
    yyscan_t scanner_ = nullptr;
};

} // namespace

BoardFile parse_file(const std::string& filename) {
    std::unique_ptr<FILE, int (*)(FILE*)> file(fopen(filename.c_str(), "r"), &fclose);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    Scanner scanner;
    yyset_in(file.get(), scanner.get());
    return scanner.parse();
}

BoardFile parse_string(const std::string& input) {
    Scanner scanner;
    yy_scan_string(input.c_str(), scanner.get());
    return scanner.parse();
}

} // namespace text
} // namespace mine_prob
