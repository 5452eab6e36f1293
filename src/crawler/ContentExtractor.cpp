#include "konduit/crawler/ContentExtractor.hpp"

#include <iostream>
#include <memory>
#include <unordered_set>

#include <lexbor/html/html.h>
#include <lexbor/dom/dom.h>

#include "konduit/Analyzer.hpp"
#include "konduit/net/Url.hpp"

namespace konduit::crawler {

namespace {

struct HtmlDocumentDeleter {
    void operator()(lxb_html_document_t* doc) const { lxb_html_document_destroy(doc); }
};
using HtmlDocumentPtr = std::unique_ptr<lxb_html_document_t, HtmlDocumentDeleter>;

const std::unordered_set<std::string>& excludedTags() {
    static const std::unordered_set<std::string> tags = {
        "script", "style", "nav", "footer", "header", "noscript", "aside", "form", "template", "svg"
    };
    return tags;
}

const std::unordered_set<std::string>& contentTags() {
    static const std::unordered_set<std::string> tags = {
        "h1", "h2", "h3", "p", "li", "div", "span"
    };
    return tags;
}

HtmlDocumentPtr parseHtml(const std::string& html) {
    HtmlDocumentPtr doc(lxb_html_document_create());
    if (!doc) {
        std::cerr << "ContentExtractor: lxb_html_document_create failed\n";
        return nullptr;
    }
    lxb_status_t status = lxb_html_document_parse(doc.get(),
        reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
    if (status != LXB_STATUS_OK) {
        std::cerr << "ContentExtractor: parse failed with status " << status << "\n";
        return nullptr;
    }
    return doc;
}

std::string tagName(lxb_dom_node_t* node) {
    if (node->type != LXB_DOM_NODE_TYPE_ELEMENT) return std::string();
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(lxb_dom_interface_element(node), &len);
    if (!name || len == 0) return std::string();
    return Analyzer::toLower(std::string(reinterpret_cast<const char*>(name), len));
}

bool isExcluded(lxb_dom_node_t* node) {
    if (node->type != LXB_DOM_NODE_TYPE_ELEMENT) return false;
    return excludedTags().count(tagName(node)) > 0;
}

// Pre-order walk over the descendants of root. visit returns false to skip a subtree.
template <typename Visit>
void walk(lxb_dom_node_t* root, Visit visit) {
    lxb_dom_node_t* node = root ? root->first_child : nullptr;
    while (node) {
        bool descend = visit(node);
        if (descend && node->first_child) {
            node = node->first_child;
            continue;
        }
        while (node != root && !node->next) node = node->parent;
        if (node == root) break;
        node = node->next;
    }
}

lxb_dom_node_t* findFirst(lxb_dom_node_t* root, const std::string& tag) {
    lxb_dom_node_t* found = nullptr;
    walk(root, [&](lxb_dom_node_t* node) {
        if (found || isExcluded(node)) return false;
        if (tagName(node) == tag) {
            found = node;
            return false;
        }
        return true;
    });
    return found;
}

std::string visibleText(lxb_dom_node_t* root) {
    std::string out;
    walk(root, [&](lxb_dom_node_t* node) {
        if (isExcluded(node)) return false;
        if (node->type == LXB_DOM_NODE_TYPE_TEXT) {
            auto* cd = lxb_dom_interface_character_data(node);
            std::string piece = Analyzer::trim(std::string(reinterpret_cast<const char*>(cd->data.data), cd->data.length));
            if (!piece.empty()) {
                if (!out.empty()) out.push_back(' ');
                out.append(piece);
            }
        }
        return true;
    });
    return Analyzer::normalizeWhitespace(out);
}

bool isBoilerplate(const std::string& text) {
    static const std::string kCopyright = "\xC2\xA9";
    return text.compare(0, kCopyright.size(), kCopyright) == 0;
}

} // namespace

std::string ContentExtractor::extract(const std::string& html) {
    auto doc = parseHtml(html);
    if (!doc) return std::string();

    lxb_dom_node_t* docNode = lxb_dom_interface_node(doc.get());
    lxb_dom_node_t* root = findFirst(docNode, "main");
    if (!root) root = findFirst(docNode, "article");
    if (!root) {
        lxb_html_body_element_t* body = lxb_html_document_body_element(doc.get());
        root = body ? lxb_dom_interface_node(body) : docNode;
    }

    std::string text;
    walk(root, [&](lxb_dom_node_t* node) {
        if (isExcluded(node)) return false;
        if (node->type == LXB_DOM_NODE_TYPE_ELEMENT && contentTags().count(tagName(node))) {
            std::string content = visibleText(node);
            if (Analyzer::splitWhitespace(content).size() >= kMinWords && !isBoilerplate(content)) {
                if (!text.empty()) text.push_back(' ');
                text.append(content);
            }
        }
        return true;
    });
    return text;
}

std::set<std::string> ContentExtractor::links(const std::string& html,
                                              const std::string& baseUrl,
                                              const std::string& domain) {
    std::set<std::string> out;
    auto doc = parseHtml(html);
    if (!doc) return out;

    walk(lxb_dom_interface_node(doc.get()), [&](lxb_dom_node_t* node) {
        if (tagName(node) != "a") return true;
        size_t len = 0;
        const lxb_char_t* href = lxb_dom_element_get_attribute(lxb_dom_interface_element(node),
            reinterpret_cast<const lxb_char_t*>("href"), 4, &len);
        if (!href || len == 0) return true;

        std::string resolved = net::resolveUrl(baseUrl, std::string(reinterpret_cast<const char*>(href), len));
        auto parsed = net::parseUrl(resolved);
        if (!parsed || !net::isHttpScheme(parsed->scheme)) return true;
        if (!net::hostMatches(parsed->host, domain)) return true;
        out.insert(parsed->toString());
        return true;
    });
    return out;
}

} // namespace konduit::crawler
