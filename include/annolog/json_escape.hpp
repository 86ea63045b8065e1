#pragma once
#include <string>
#include <string_view>

namespace al {

// Appends `s` as a quoted JSON string; control bytes become \uXXXX.
void append_json_string(std::string& out, std::string_view s);

}
