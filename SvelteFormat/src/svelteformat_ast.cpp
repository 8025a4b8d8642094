//
// svelteformat_ast.cpp
// SvelteFormat - Element Vocabulary
//

#include "svelteformat_ast.h"
#include <algorithm>
#include <iterator>

namespace SvelteFormat {

// http://xahlee.info/js/html5_non-closing_tag.html
static const char* const VOID_ELEMENTS[] = {
    "area", "base", "br", "col", "embed", "hr", "img", "input",
    "link", "meta", "param", "source", "track", "wbr"
};

// https://developer.mozilla.org/en-US/docs/Web/HTML/Inline_elements#Elements
static const char* const INLINE_ELEMENTS[] = {
    "a", "abbr", "audio", "b", "bdi", "bdo", "br", "button", "canvas",
    "cite", "code", "data", "datalist", "del", "dfn", "em", "embed", "i",
    "iframe", "img", "input", "ins", "kbd", "label", "map", "mark", "meter",
    "noscript", "object", "output", "picture", "progress", "q", "ruby", "s",
    "samp", "select", "slot", "small", "span", "strong", "sub", "sup", "svg",
    "template", "textarea", "time", "u", "var", "video", "wbr"
};

template <size_t N>
static bool containsName(const char* const (&names)[N], const std::string& name) {
    return std::find_if(std::begin(names), std::end(names),
                        [&name](const char* candidate) { return name == candidate; })
           != std::end(names);
}

bool isVoidElementName(const std::string& name) {
    return containsName(VOID_ELEMENTS, name);
}

bool isInlineElementName(const std::string& name) {
    return containsName(INLINE_ELEMENTS, name);
}

} // namespace SvelteFormat
