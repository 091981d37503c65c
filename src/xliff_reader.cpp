#include "xliff_reader.hpp"

#include "text_normalize.hpp"

namespace {

std::string local_name(const char* raw_name) {
    if (raw_name == nullptr) {
        return {};
    }
    std::string name(raw_name);
    const auto pos = name.find(':');
    if (pos == std::string::npos) {
        return name;
    }
    return name.substr(pos + 1);
}

bool has_local_name(const pugi::xml_node& node, const char* name) {
    return node.type() == pugi::node_element && local_name(node.name()) == name;
}

void collect_text(const pugi::xml_node& node, std::string& out) {
    if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
        out.append(node.value());
        return;
    }

    if (node.type() != pugi::node_element) {
        return;
    }

    for (const auto& child : node.children()) {
        collect_text(child, out);
    }
}

std::string inner_text(const pugi::xml_node& node) {
    std::string out;
    collect_text(node, out);
    return out;
}

// Pre-order, so results come back in document order.
void collect_elements(const pugi::xml_node& node, const char* name, std::vector<pugi::xml_node>& out) {
    if (node.type() != pugi::node_element) {
        return;
    }
    if (has_local_name(node, name)) {
        out.push_back(node);
    }
    for (const auto& child : node.children()) {
        collect_elements(child, name, out);
    }
}

bool contains_element(const pugi::xml_node& node, const char* name) {
    if (has_local_name(node, name)) {
        return true;
    }
    for (const auto& child : node.children()) {
        if (contains_element(child, name)) {
            return true;
        }
    }
    return false;
}

pugi::xml_node first_child_named(const pugi::xml_node& parent, const char* name) {
    for (const auto& child : parent.children()) {
        if (has_local_name(child, name)) {
            return child;
        }
    }
    return {};
}

pugi::xml_node first_descendant_named(const pugi::xml_node& parent, const char* name) {
    if (auto direct = first_child_named(parent, name)) {
        return direct;
    }
    for (const auto& child : parent.children()) {
        std::vector<pugi::xml_node> found;
        collect_elements(child, name, found);
        if (!found.empty()) {
            return found.front();
        }
    }
    return {};
}

std::vector<pugi::xml_node> segments_of(const pugi::xml_node& unit) {
    std::vector<pugi::xml_node> segments;
    for (const auto& child : unit.children()) {
        if (has_local_name(child, "segment")) {
            segments.push_back(child);
        }
    }
    if (!segments.empty()) {
        return segments;
    }

    for (const auto& child : unit.children()) {
        collect_elements(child, "segment", segments);
    }
    return segments;
}

void visit_flat(const pugi::xml_node& root, const std::function<void(TranslationUnit)>& visit) {
    std::vector<pugi::xml_node> trans_units;
    collect_elements(root, "trans-unit", trans_units);

    for (const auto& tu : trans_units) {
        const auto source = first_child_named(tu, "source");
        const auto target = first_child_named(tu, "target");
        if (!source || !target) {
            continue;
        }

        TranslationUnit unit;
        unit.id = tu.attribute("id").value();
        unit.source_text = inner_text(source);
        unit.target_text = inner_text(target);
        visit(std::move(unit));
    }
}

void visit_segmented(const pugi::xml_node& root, const std::function<void(TranslationUnit)>& visit) {
    std::vector<pugi::xml_node> units;
    collect_elements(root, "unit", units);

    for (const auto& unit_node : units) {
        const std::string unit_id = unit_node.attribute("id").value();
        const auto segments = segments_of(unit_node);

        for (std::size_t i = 0; i < segments.size(); ++i) {
            const auto source = first_descendant_named(segments[i], "source");
            const auto target = first_descendant_named(segments[i], "target");
            if (!source || !target) {
                continue;
            }

            TranslationUnit unit;
            unit.id = segments.size() == 1 ? unit_id : unit_id + ":" + std::to_string(i + 1);
            unit.source_text = inner_text(source);
            unit.target_text = inner_text(target);
            visit(std::move(unit));
        }
    }
}

bool finish_load(
    const pugi::xml_parse_result& parse,
    const std::string& label,
    XliffDocument& out_doc,
    std::string& error
) {
    if (!parse) {
        error = "Failed to parse XML " + label + ": " + parse.description() +
            " at offset " + std::to_string(parse.offset);
        out_doc.xml.reset();
        return false;
    }

    std::size_t roots = 0;
    for (const auto& child : out_doc.xml.children()) {
        if (child.type() == pugi::node_element) {
            ++roots;
        } else if ((child.type() == pugi::node_pcdata || child.type() == pugi::node_cdata) &&
                   !trim_whitespace(child.value()).empty()) {
            error = "Failed to parse XML " + label + ": text outside the root element";
            out_doc.xml.reset();
            return false;
        }
    }
    if (roots > 1) {
        error = "Failed to parse XML " + label + ": multiple root elements";
        out_doc.xml.reset();
        return false;
    }

    const auto root = out_doc.xml.document_element();
    if (!root) {
        error = "No root element in XML: " + label;
        out_doc.xml.reset();
        return false;
    }

    out_doc.shape = detect_shape(root);
    return true;
}

// parse_fragment keeps document-level text and extra roots visible so finish_load can reject them.
constexpr unsigned int kParseOptions = pugi::parse_default | pugi::parse_ws_pcdata | pugi::parse_fragment;

}  // namespace

bool read_xliff_file(const std::filesystem::path& path, XliffDocument& out_doc, std::string& error) {
    out_doc.shape = XliffShape::Flat;

    const pugi::xml_parse_result parse = out_doc.xml.load_file(path.c_str(), kParseOptions);
    return finish_load(parse, path.string(), out_doc, error);
}

bool read_xliff_string(const std::string& content, XliffDocument& out_doc, std::string& error) {
    out_doc.shape = XliffShape::Flat;

    const pugi::xml_parse_result parse = out_doc.xml.load_buffer(content.data(), content.size(), kParseOptions);
    return finish_load(parse, "<memory>", out_doc, error);
}

XliffShape detect_shape(const pugi::xml_node& root) {
    return contains_element(root, "trans-unit") ? XliffShape::Flat : XliffShape::Segmented;
}

void for_each_unit(const XliffDocument& doc, const std::function<void(TranslationUnit)>& visit) {
    const auto root = doc.xml.document_element();
    if (!root) {
        return;
    }

    switch (doc.shape) {
    case XliffShape::Flat:
        visit_flat(root, visit);
        break;
    case XliffShape::Segmented:
        visit_segmented(root, visit);
        break;
    }
}

std::vector<TranslationUnit> extract_units(const XliffDocument& doc) {
    std::vector<TranslationUnit> units;
    for_each_unit(doc, [&](TranslationUnit unit) {
        units.push_back(std::move(unit));
    });
    return units;
}

std::vector<std::string> collect_target_texts(const XliffDocument& doc, bool skip_empty) {
    std::vector<std::string> targets;
    const auto root = doc.xml.document_element();
    if (!root) {
        return targets;
    }

    std::vector<pugi::xml_node> nodes;
    collect_elements(root, "target", nodes);
    for (const auto& node : nodes) {
        std::string text = trim_whitespace(inner_text(node));
        if (skip_empty && text.empty()) {
            continue;
        }
        targets.push_back(std::move(text));
    }
    return targets;
}

const char* shape_name(XliffShape shape) {
    switch (shape) {
    case XliffShape::Flat:
        return "flat";
    case XliffShape::Segmented:
        return "segmented";
    }
    return "unknown";
}
