#pragma once

#include <string>

// One source/target pair as found in the document. Ids are not unique across shapes:
// segmented units may repeat the parent id with a ":<n>" suffix.
struct TranslationUnit {
    std::string id;
    std::string source_text;
    std::string target_text;
};
