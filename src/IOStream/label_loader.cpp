#include "label_loader.h"

#include <fstream>

#include "grpaf_exception.h"

using grpaf::FormatError;
using grpaf::InputError;

void LabelLoader::load_labels(const std::string& path)
{
    std::ifstream ifs(path);
    CHECK_CONDITION_THROW(!ifs.is_open(), InputError, "loading labels: cannot open {}", path);

    std::string line;
    std::string sample;
    std::string group;
    size_t line_no = 0;
    while (std::getline(ifs, line)) {
        ++line_no;
        if (!parse_line(line, line_no, sample, group)) {
            continue;
        }
        membership_.add(sample, group);
        rows_++;
    }
    CHECK_CONDITION_THROW(ifs.bad(), InputError, "loading labels: read error in {} after line {}", path, line_no);
    ifs.close();
}

bool LabelLoader::parse_line(const std::string& line, size_t line_no, std::string& sample, std::string& group)
{
    std::string row = line;
    if (!row.empty() && row.back() == '\r') {
        row.pop_back();
    }
    if (row.empty() || row.front() == '#') {
        return false;
    }

    size_t tab = row.find('\t');
    CHECK_CONDITION_THROW(tab == std::string::npos, FormatError, "loading labels: line {} has fewer than two tab separated columns",
                          line_no);
    size_t end = row.find('\t', tab + 1);
    sample = row.substr(0, tab);
    group = row.substr(tab + 1, end == std::string::npos ? std::string::npos : end - tab - 1);
    CHECK_CONDITION_THROW(sample.empty() || group.empty(), FormatError, "loading labels: line {} has an empty sample or group",
                          line_no);
    return true;
}
