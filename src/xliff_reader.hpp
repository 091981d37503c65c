#pragma once

#include "unit.hpp"

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include <pugixml.hpp>

// Flat: XLIFF 1.x trans-unit elements. Segmented: XLIFF 2.x unit/segment elements.
enum class XliffShape {
    Flat,
    Segmented
};

struct XliffDocument {
    pugi::xml_document xml;
    XliffShape shape = XliffShape::Flat;
};

bool read_xliff_file(const std::filesystem::path& path, XliffDocument& out_doc, std::string& error);
bool read_xliff_string(const std::string& content, XliffDocument& out_doc, std::string& error);

// Flat wins whenever a trans-unit element exists anywhere below root.
XliffShape detect_shape(const pugi::xml_node& root);

// Walks the tree on every call, so the sequence can be restarted by calling again.
void for_each_unit(const XliffDocument& doc, const std::function<void(TranslationUnit)>& visit);
std::vector<TranslationUnit> extract_units(const XliffDocument& doc);

std::vector<std::string> collect_target_texts(const XliffDocument& doc, bool skip_empty);

const char* shape_name(XliffShape shape);
