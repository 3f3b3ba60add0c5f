#pragma once

#include <istream>
#include <string>

#include "datatypes.hpp"

namespace data {

    // Reads daily bars from "Date,Open,High,Low,Close,Volume" text. The header row
    // is optional, blank lines are skipped and columns past Volume are ignored.
    // Results are sorted by date. Malformed rows throw core::DataLoadException
    // naming the source and line number.
    class CsvLoader {
    public:
        static core::PriceSeries loadFile(const std::string& path);

        // `source_name` only appears in error messages
        static core::PriceSeries parse(std::istream& input, const std::string& source_name);
    };

} // namespace data
