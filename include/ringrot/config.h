#pragma once

#include <string>

#include <fmt/core.h>

#include "ringrot/defines.h"

namespace ringrot {

struct ProcessorConfig {
    std::string id_column = "id";     // input column holding the record identifier
    std::string json_column = "json"; // input column holding the JSON array
    char delimiter = ',';             // field delimiter for both input and output

    std::string toString() const {
        std::string args_str = fmt::format("id_column={} json_column={}", id_column, json_column);
        if (delimiter != ProcessorConfig().delimiter) {
            args_str += fmt::format(" delimiter='{}'", delimiter);
        }
        return args_str;
    }
};

} // namespace ringrot
