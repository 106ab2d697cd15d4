#pragma once
#include <string>
#include <vector>
#include <map>
#include <optional>

namespace GateResolve {

    struct HtmlElement {
        std::string tag;                                // lowercase local name
        std::map<std::string, std::string> attributes;  // lowercase names
        std::string text;                               // text content (capped for container tags)
        int parent = -1;                                // index into HtmlDocument::Elements()

        std::string Attr(const std::string& name) const;
        bool Has(const std::string& name) const;
    };

    // Flattened DOM of one page, in document order. Parsed with lexbor and then released,
    // so the document holds only plain strings.
    class HtmlDocument {
    public:
        static std::optional<HtmlDocument> Parse(const std::string& html_content);

        const std::vector<HtmlElement>& Elements() const { return elements_; }
        std::vector<const HtmlElement*> ByTag(const std::string& tag) const;
        const HtmlElement* Parent(const HtmlElement& element) const;
        // True when element is ancestor itself or nested anywhere below it.
        bool IsInside(const HtmlElement& element, const HtmlElement& ancestor) const;
        std::vector<std::string> ScriptTexts() const;
        std::string Title() const { return title_; }

    private:
        std::vector<HtmlElement> elements_;
        std::string title_;
    };

}
