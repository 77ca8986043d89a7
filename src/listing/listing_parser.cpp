#include <lexbor/dom/dom.h>
#include <lexbor/html/html.h>

#include <cstring>
#include <memory>

#include "listing_parser.hpp"
#include "../http/url.hpp"

namespace {

struct DocumentDeleter {
    void operator()(lxb_html_document_t* d) const { lxb_html_document_destroy(d); }
};

struct CollectionDeleter {
    void operator()(lxb_dom_collection_t* c) const { lxb_dom_collection_destroy(c, true); }
};

using DocumentPtr = std::unique_ptr<lxb_html_document_t, DocumentDeleter>;
using CollectionPtr = std::unique_ptr<lxb_dom_collection_t, CollectionDeleter>;

const lxb_char_t* as_lxb(const char* s) {
    return reinterpret_cast<const lxb_char_t*>(s);
}

bool is_tag(lxb_dom_element_t* el, std::string_view tag) {
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(el, &len);
    return name != nullptr && std::string_view(reinterpret_cast<const char*>(name), len) == tag;
}

std::string text_of(lxb_dom_document_t* doc, lxb_dom_element_t* el) {
    size_t len = 0;
    lxb_char_t* text = lxb_dom_node_text_content(lxb_dom_interface_node(el), &len);
    if (text == nullptr)
        return {};
    std::string s(reinterpret_cast<const char*>(text), len);
    lxb_dom_document_destroy_text(doc, text);
    return s;
}

void collect_anchors(lxb_dom_document_t* doc, lxb_dom_element_t* cell,
                     std::string_view base_url, Listing& out) {
    CollectionPtr anchors(lxb_dom_collection_make(doc, 8));
    if (!anchors)
        return;
    if (lxb_dom_elements_by_tag_name(cell, anchors.get(), as_lxb("a"), 1) != LXB_STATUS_OK)
        return;

    for (size_t i = 0; i < lxb_dom_collection_length(anchors.get()); ++i) {
        lxb_dom_element_t* a = lxb_dom_collection_element(anchors.get(), i);

        size_t href_len = 0;
        const lxb_char_t* raw = lxb_dom_element_get_attribute(a, as_lxb("href"), 4, &href_len);
        if (raw == nullptr)
            continue;
        std::string_view href(reinterpret_cast<const char*>(raw), href_len);

        if (href.starts_with(".."))
            continue;

        auto url = resolve_url(base_url, href);
        if (!url)
            continue;

        auto name = text_of(doc, a);
        if (href.ends_with('/'))
            out.folders.push_back({std::move(name), std::move(*url)});
        else
            out.files.push_back({std::move(name), std::move(*url), std::nullopt});
    }
}

} // namespace

Listing parse_listing(std::string_view base_url, std::string_view html) {
    Listing listing;
    listing.folders.push_back({"..", resolve_url(base_url, "..").value_or(std::string(base_url))});

    DocumentPtr document(lxb_html_document_create());
    if (!document)
        return listing;

    auto status = lxb_html_document_parse(document.get(),
        reinterpret_cast<const lxb_char_t*>(html.data()), html.size());
    if (status != LXB_STATUS_OK)
        return listing;

    lxb_dom_document_t* doc = &document->dom_document;
    lxb_dom_element_t* root = lxb_dom_document_element(doc);
    if (root == nullptr)
        return listing;

    CollectionPtr cells(lxb_dom_collection_make(doc, 128));
    if (!cells)
        return listing;

    status = lxb_dom_elements_by_class_name(root, cells.get(),
        as_lxb(NAME_CELL_CLASS), std::strlen(NAME_CELL_CLASS));
    if (status != LXB_STATUS_OK)
        return listing;

    for (size_t i = 0; i < lxb_dom_collection_length(cells.get()); ++i) {
        lxb_dom_element_t* cell = lxb_dom_collection_element(cells.get(), i);
        if (is_tag(cell, "td"))
            collect_anchors(doc, cell, base_url, listing);
    }

    return listing;
}
