#ifndef LABEL_LOADER_H
#define LABEL_LOADER_H

#include <string>

#include "group_mask.h"

/// @brief Load a headerless "<sample>\t<group>" label file, columns beyond the second are ignored
class LabelLoader
{
public:
    explicit LabelLoader(const std::string& path)
        : membership_({})
        , rows_(0)
    {
        load_labels(path);
    }
    ~LabelLoader() = default;

    const grpaf::GroupMembership& get_membership() const { return membership_; }
    uint32_t get_rows() const { return rows_; }

    /// @brief Parse one label row
    /// @param line row without trailing newline
    /// @param line_no 1-based line number, used in error messages
    /// @param sample out| first column
    /// @param group out| second column
    /// @return false when the row is empty or a comment
    static bool parse_line(const std::string& line, size_t line_no, std::string& sample, std::string& group);

private:
    grpaf::GroupMembership membership_;
    uint32_t rows_;

private:
    void load_labels(const std::string& path);
};

#endif  // LABEL_LOADER_H
