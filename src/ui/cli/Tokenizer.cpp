#include "Tokenizer.hpp"

#include <cctype>
#include <cstddef>
#include <utility>

namespace notevault::ui::cli
{

std::optional<std::vector<std::string>> Tokenizer::tokenize(std::string_view line)
{
    std::vector<std::string> out{};
    Word word{};
    Quote quote{ Quote::None };

    for (std::size_t i{}; i < line.size(); ++i)
    {
        const char c{ line[i] };
        const bool hasNext{ i + 1 < line.size() };

        switch (quote)
        {
        case Quote::Single:
            if (c == '\'')
            {
                quote = Quote::None;
            }
            else
            {
                word.text.push_back(c);
            }
            break;

        case Quote::Double:
            if (c == '"')
            {
                quote = Quote::None;
            }
            else if (c == '\\' && hasNext && (line[i + 1] == '"' || line[i + 1] == '\\'))
            {
                word.text.push_back(line[++i]);
            }
            else
            {
                word.text.push_back(c);
            }
            break;

        case Quote::None:
            if (std::isspace(static_cast<unsigned char>(c)) != 0)
            {
                flush(word, out);
            }
            else if (c == '\'' || c == '"')
            {
                quote = (c == '\'') ? Quote::Single : Quote::Double;
                word.started = true;
            }
            else if (c == '\\' && hasNext)
            {
                word.text.push_back(line[++i]);
                word.started = true;
            }
            else
            {
                word.text.push_back(c);
                word.started = true;
            }
            break;
        }
    }

    if (quote != Quote::None)
    {
        return std::nullopt;
    }
    flush(word, out);
    return out;
}

void Tokenizer::flush(Word& word, std::vector<std::string>& out)
{
    if (word.started)
    {
        out.push_back(std::move(word.text));
    }
    word = Word{};
}

} // namespace notevault::ui::cli
