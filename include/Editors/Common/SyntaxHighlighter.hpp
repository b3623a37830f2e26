#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace InkWell {

enum class TokenKind { Keyword, String, Comment, Number, Identifier, Operator, Whitespace, CodeBlock };

struct StyledSpan
{
    size_t offset;  // byte offset into the highlighted text
    size_t length;  // number of bytes
    TokenKind kind;

    bool operator==(const StyledSpan &o) const { return offset == o.offset && length == o.length && kind == o.kind; }
};

// Lua lexical highlighting of a whole script. Spans are ordered, never
// overlap and never include newline characters.
std::vector<StyledSpan> highlight(const std::string &text);

// Highlights only ``` fenced blocks inside a document. Each block yields a
// CodeBlock span covering the fences, followed by the spans of its content.
std::vector<StyledSpan> highlightCodeBlocks(const std::string &document);

const char *toString(TokenKind kind);

} // namespace InkWell
