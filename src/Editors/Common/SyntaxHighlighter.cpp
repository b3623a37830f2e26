#include <Editors/Common/SyntaxHighlighter.hpp>
#include <cctype>
#include <unordered_set>

namespace InkWell {

namespace {

const std::unordered_set<std::string> &luaKeywords()
{
    static const std::unordered_set<std::string> kw = {"and", "break", "do", "else", "elseif", "end", "false", "for", "function", "goto", "if", "in", "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while"};
    return kw;
}

// Tokenizes one line starting at `base`. `inBlockComment` carries a
// --[[ ]] comment across lines.
void tokenizeLine(const std::string &line, size_t base, bool &inBlockComment, std::vector<StyledSpan> &tokens)
{
    if (line.empty())
        return;

    size_t pos = 0;

    // If inside a multi-line comment from a previous line
    if (inBlockComment)
    {
        size_t end = line.find("]]");
        if (end == std::string::npos)
        {
            tokens.push_back({base, line.size(), TokenKind::Comment});
            return;
        }
        tokens.push_back({base, end + 2, TokenKind::Comment});
        pos = end + 2;
        inBlockComment = false;
    }

    while (pos < line.length())
    {
        // Detect single-line '--' and multi-line '--[[' comments
        if (line[pos] == '-' && pos + 1 < line.length() && line[pos + 1] == '-')
        {
            if (pos + 3 < line.length() && line[pos + 2] == '[' && line[pos + 3] == '[')
            {
                size_t end = line.find("]]", pos + 4);
                if (end == std::string::npos)
                {
                    tokens.push_back({base + pos, line.size() - pos, TokenKind::Comment});
                    inBlockComment = true;
                    return;
                }
                tokens.push_back({base + pos, end + 2 - pos, TokenKind::Comment});
                pos = end + 2;
                continue;
            }
            tokens.push_back({base + pos, line.size() - pos, TokenKind::Comment});
            return;
        }

        TokenKind kind = TokenKind::Operator;
        size_t start = pos;
        unsigned char c = static_cast<unsigned char>(line[pos]);
        if (std::isspace(c))
        {
            while (pos < line.length() && std::isspace(static_cast<unsigned char>(line[pos])))
                pos++;
            kind = TokenKind::Whitespace;
        }
        else if (c == '"' || c == '\'')
        {
            char q = line[pos];
            size_t s = pos + 1;
            bool esc = false;
            while (s < line.length())
            {
                if (!esc && line[s] == q)
                {
                    s++;
                    break;
                }
                esc = (line[s] == '\\' && !esc);
                s++;
            }
            pos = s;
            kind = TokenKind::String;
        }
        else if (std::isdigit(c))
        {
            while (pos < line.length() && (std::isxdigit(static_cast<unsigned char>(line[pos])) || line[pos] == '.' || line[pos] == 'x' || line[pos] == 'X'))
                pos++;
            kind = TokenKind::Number;
        }
        else if (std::isalpha(c) || c == '_')
        {
            while (pos < line.length() && (std::isalnum(static_cast<unsigned char>(line[pos])) || line[pos] == '_'))
                pos++;
            kind = luaKeywords().count(line.substr(start, pos - start)) ? TokenKind::Keyword : TokenKind::Identifier;
        }
        else
        {
            pos++;
        }

        tokens.push_back({base + start, pos - start, kind});
    }
}

} // namespace

std::vector<StyledSpan> highlight(const std::string &text)
{
    std::vector<StyledSpan> tokens;
    bool inBlockComment = false;
    size_t lineStart = 0;
    while (lineStart <= text.size())
    {
        size_t nl = text.find('\n', lineStart);
        size_t lineEnd = nl == std::string::npos ? text.size() : nl;
        std::string line = text.substr(lineStart, lineEnd - lineStart);
        if (!line.empty() && line.back() == '\r')
            line.pop_back();
        tokenizeLine(line, lineStart, inBlockComment, tokens);
        if (nl == std::string::npos)
            break;
        lineStart = nl + 1;
    }
    return tokens;
}

std::vector<StyledSpan> highlightCodeBlocks(const std::string &document)
{
    static const std::string fence = "```";
    std::vector<StyledSpan> spans;
    size_t pos = 0;
    for (;;)
    {
        size_t open = document.find(fence, pos);
        if (open == std::string::npos)
            break;
        size_t close = document.find(fence, open + fence.size());
        if (close == std::string::npos)
            break;

        size_t contentStart = open + fence.size();
        spans.push_back({open, close + fence.size() - open, TokenKind::CodeBlock});
        for (const auto &span : highlight(document.substr(contentStart, close - contentStart)))
            spans.push_back({span.offset + contentStart, span.length, span.kind});
        pos = close + fence.size();
    }
    return spans;
}

const char *toString(TokenKind kind)
{
    switch (kind)
    {
    case TokenKind::Keyword: return "keyword";
    case TokenKind::String: return "string";
    case TokenKind::Comment: return "comment";
    case TokenKind::Number: return "number";
    case TokenKind::Identifier: return "identifier";
    case TokenKind::Operator: return "operator";
    case TokenKind::Whitespace: return "whitespace";
    case TokenKind::CodeBlock: return "codeblock";
    }
    return "unknown";
}

} // namespace InkWell
