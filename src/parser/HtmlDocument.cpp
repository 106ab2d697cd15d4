#include "HtmlDocument.hpp"
#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>
#include <algorithm>
#include <utility>

namespace {

// Helper to convert lxb_char_t* to std::string
std::string to_std_string(const lxb_char_t* lxb_str, size_t len) {
    if (lxb_str && len > 0) {
        return std::string(reinterpret_cast<const char*>(lxb_str), len);
    }
    return "";
}

// ASCII lowercase helper
inline void ascii_tolower_inplace(std::string& s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
}

// Text of container elements is only needed for short labels and countdown digits.
constexpr size_t kMaxContainerText = 2048;

bool KeepsFullText(const std::string& tag) {
    return tag == "script" || tag == "style" || tag == "title" || tag == "a" || tag == "button";
}

bool WantsText(const std::string& tag) {
    return KeepsFullText(tag) || tag == "span" || tag == "div" || tag == "p" || tag == "b"
        || tag == "strong" || tag == "label" || tag == "h1" || tag == "h2" || tag == "h3";
}

std::string TextOf(lxb_dom_node_t* node) {
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
    std::string out = to_std_string(text, len);
    if (text) lxb_dom_document_destroy_text(node->owner_document, text);
    return out;
}

} // anonymous namespace

namespace GateResolve {

std::string HtmlElement::Attr(const std::string& name) const {
    auto it = attributes.find(name);
    return it == attributes.end() ? std::string() : it->second;
}

bool HtmlElement::Has(const std::string& name) const {
    return attributes.find(name) != attributes.end();
}

std::optional<HtmlDocument> HtmlDocument::Parse(const std::string& html_content) {
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) return std::nullopt;

    lxb_status_t status = lxb_html_document_parse(document,
        reinterpret_cast<const lxb_char_t*>(html_content.c_str()),
        html_content.length());

    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        return std::nullopt;
    }

    HtmlDocument doc;
    {
        size_t tlen = 0;
        const lxb_char_t* t = lxb_html_document_title(document, &tlen);
        doc.title_ = to_std_string(t, tlen);
    }

    lxb_dom_document_t* dom_doc = lxb_html_document_original_ref(document);
    lxb_dom_node_t* root = lxb_dom_interface_node(lxb_dom_document_element(dom_doc));

    // Depth-first walk; each stack frame remembers the flattened index of its element.
    std::vector<std::pair<lxb_dom_node_t*, int>> stack;
    if (root) stack.emplace_back(root, -1);
    while (!stack.empty()) {
        auto [node, parent_index] = stack.back();
        stack.pop_back();

        int my_index = parent_index;
        if (node->type == LXB_DOM_NODE_TYPE_ELEMENT) {
            lxb_dom_element_t* el = lxb_dom_interface_element(node);
            HtmlElement element;
            size_t name_len = 0;
            const lxb_char_t* name = lxb_dom_element_local_name(el, &name_len);
            element.tag = to_std_string(name, name_len);
            ascii_tolower_inplace(element.tag);
            element.parent = parent_index;

            for (lxb_dom_attr_t* attr = lxb_dom_element_first_attribute(el); attr != nullptr;
                 attr = lxb_dom_element_next_attribute(attr)) {
                size_t key_len = 0;
                size_t value_len = 0;
                const lxb_char_t* key = lxb_dom_attr_local_name(attr, &key_len);
                const lxb_char_t* value = lxb_dom_attr_value(attr, &value_len);
                std::string k = to_std_string(key, key_len);
                ascii_tolower_inplace(k);
                element.attributes.emplace(std::move(k), to_std_string(value, value_len));
            }

            if (WantsText(element.tag)) {
                element.text = TextOf(node);
                if (!KeepsFullText(element.tag) && element.text.size() > kMaxContainerText) {
                    element.text.resize(kMaxContainerText);
                }
            }

            doc.elements_.push_back(std::move(element));
            my_index = static_cast<int>(doc.elements_.size() - 1);
        }

        // Push children in reverse so they pop in document order.
        std::vector<lxb_dom_node_t*> children;
        for (lxb_dom_node_t* child = node->first_child; child != nullptr; child = child->next) {
            if (child->type == LXB_DOM_NODE_TYPE_ELEMENT) children.push_back(child);
        }
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            stack.emplace_back(*it, my_index);
        }
    }

    lxb_html_document_destroy(document);
    return doc;
}

std::vector<const HtmlElement*> HtmlDocument::ByTag(const std::string& tag) const {
    std::vector<const HtmlElement*> out;
    for (const auto& el : elements_) {
        if (el.tag == tag) out.push_back(&el);
    }
    return out;
}

const HtmlElement* HtmlDocument::Parent(const HtmlElement& element) const {
    if (element.parent < 0 || element.parent >= static_cast<int>(elements_.size())) return nullptr;
    return &elements_[element.parent];
}

bool HtmlDocument::IsInside(const HtmlElement& element, const HtmlElement& ancestor) const {
    for (const HtmlElement* cur = &element; cur != nullptr; cur = Parent(*cur)) {
        if (cur == &ancestor) return true;
    }
    return false;
}

std::vector<std::string> HtmlDocument::ScriptTexts() const {
    std::vector<std::string> out;
    for (const auto& el : elements_) {
        if (el.tag == "script" && !el.text.empty()) out.push_back(el.text);
    }
    return out;
}

}
