#pragma once

#include <string>

#include "docflow/v1/types.pb.h"

namespace docflow::model {

docflow::v1::DocumentRef MakeDocumentRef(const std::string& container, const std::string& key);

// Throws util::InvalidArgument when container or key is empty.
void ValidateDocumentRef(const docflow::v1::DocumentRef& ref);

// "<container>/<key>", for logs and error messages.
std::string ToString(const docflow::v1::DocumentRef& ref);

} // namespace docflow::model
