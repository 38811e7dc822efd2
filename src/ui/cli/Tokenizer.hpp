#ifndef NOTEVAULT_UI_CLI_TOKENIZER_HPP
#define NOTEVAULT_UI_CLI_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notevault::ui::cli
{

// Splits a shell line into words so note titles with spaces can be typed.
//
// 'single quotes' are literal, "double quotes" honor \" and \\, a backslash outside quotes escapes the
// next character. Adjacent quoted and bare parts join into one word. Returns nullopt on an unterminated quote.
class Tokenizer final
{
public:
    [[nodiscard]] static std::optional<std::vector<std::string>> tokenize(std::string_view line);

private:
    enum class Quote
    {
        None,
        Single,
        Double
    };

    struct Word
    {
        std::string text;
        bool started{ false };
    };

    static void flush(Word& word, std::vector<std::string>& out);
};

} // namespace notevault::ui::cli

#endif // NOTEVAULT_UI_CLI_TOKENIZER_HPP
