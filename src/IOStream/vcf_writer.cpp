#include "vcf_writer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sstream>

#include "grpaf_exception.h"
#include "grpaf_logger.h"

using grpaf::OutputError;

static constexpr const char* s_command_line_key = "grpafCommandLine";

VcfWriter::~VcfWriter()
{
    if (nullptr != out_file_) {
        if (0 != hts_close(out_file_)) {
            GrpafLogger::warn("close output error: {}", path_);
        }
        out_file_ = nullptr;
    }
    if (nullptr != out_hdr_) {
        bcf_hdr_destroy(out_hdr_);
        out_hdr_ = nullptr;
    }
}

void VcfWriter::start(const std::string& path, bcf_hdr_t* in_hdr, const grpaf::InfoDescriptors& descriptors,
                      const std::string& tool_name, const std::string& command_line)
{
    CHECK_CONDITION_THROW(compression_level_ < 0 || compression_level_ > 9, OutputError, "invalid compression level {}",
                          compression_level_);
    path_ = path;
    in_hdr_ = in_hdr;

    const char* mode = "w";
    if (is_gz_file(path.c_str())) {
        const char* level_to_model[10]{"wz0", "wz1", "wz2", "wz3", "wz4", "wz5", "wz", "wz7", "wz8", "wz9"};
        mode = level_to_model[compression_level_];
    }
    out_file_ = hts_open(path.c_str(), mode);
    CHECK_CONDITION_THROW(nullptr == out_file_, OutputError, "writing output: failed to open {}", path);

    out_hdr_ = init_vcf_header(in_hdr, descriptors, tool_name, command_line, stale_tags_);
    if (!stale_tags_.empty()) {
        std::ostringstream oss;
        for (size_t i = 0; i < stale_tags_.size(); ++i) {
            oss << (i ? "," : "") << stale_tags_[i];
        }
        GrpafLogger::info("removing {} tags of a previous annotation: {}", stale_tags_.size(), oss.str());
    }

    int32_t ret = bcf_hdr_write(out_file_, out_hdr_);
    CHECK_CONDITION_THROW(ret != 0, OutputError, "writing output: write header: {}", std::strerror(errno));
}

void VcfWriter::write(bcf1_t* b, const grpaf::AnnotatedValues& values)
{
    int32_t ret = 0;
    for (const std::string& tag : stale_tags_) {
        int32_t id = bcf_hdr_id2int(in_hdr_, BCF_DT_ID, tag.c_str());
        ret = bcf_update_info(in_hdr_, b, tag.c_str(), nullptr, 0, bcf_hdr_id2type(in_hdr_, BCF_HL_INFO, id));
        CHECK_CONDITION_THROW(ret < 0, OutputError, "writing output: remove {} from record {}", tag, records_written_ + 1);
    }

    ret = bcf_translate(out_hdr_, in_hdr_, b);
    CHECK_CONDITION_THROW(ret < 0, OutputError, "writing output: translate record {}", records_written_ + 1);

    for (const grpaf::InfoValue& v : values) {
        const char* key = v.descriptor->id.c_str();
        if (v.descriptor->type == grpaf::InfoType::INTEGER) {
            ret = bcf_update_info_int32(out_hdr_, b, key, v.int_values.data(), static_cast<int32_t>(v.int_values.size()));
        }
        else {
            ret = bcf_update_info_float(out_hdr_, b, key, v.float_values.data(), static_cast<int32_t>(v.float_values.size()));
        }
        CHECK_CONDITION_THROW(ret < 0, OutputError, "writing output: set {} on record {}", key, records_written_ + 1);
    }

    ret = bcf_write(out_file_, out_hdr_, b);
    CHECK_CONDITION_THROW(ret != 0, OutputError, "writing output: write record {}: {}", records_written_ + 1, std::strerror(errno));
    records_written_++;
}

void VcfWriter::close_file()
{
    if (nullptr == out_file_) {
        return;
    }
    int32_t ret = hts_close(out_file_);
    out_file_ = nullptr;
    CHECK_CONDITION_THROW(ret != 0, OutputError, "writing output: close {}", path_);
}

bcf_hdr_t* VcfWriter::init_vcf_header(bcf_hdr_t* in_hdr, const grpaf::InfoDescriptors& descriptors, const std::string& tool_name,
                                      const std::string& command_line, std::vector<std::string>& stale_tags)
{
    stale_tags.clear();
    for (int32_t i{0}; i < in_hdr->n[BCF_DT_ID]; ++i) {
        const char* key = in_hdr->id[BCF_DT_ID][i].key;
        if (nullptr != key && bcf_hdr_idinfo_exists(in_hdr, BCF_HL_INFO, i) && grpaf::is_synthesized_tag_id(key)) {
            stale_tags.emplace_back(key);
        }
    }

    bcf_hdr_t* hdr = bcf_hdr_dup(in_hdr);
    CHECK_CONDITION_THROW(nullptr == hdr, OutputError, "writing output: can not create vcf header");

    int32_t ret = 0;
    for (const std::string& tag : stale_tags) {
        bcf_hdr_remove(hdr, BCF_HL_INFO, tag.c_str());
    }
    for (const grpaf::InfoDescriptor& d : descriptors) {
        ret = bcf_hdr_append(hdr, d.to_header_line().c_str());
        if (ret != 0) {
            bcf_hdr_destroy(hdr);
            throw OutputError(fmt::format("writing output: bcf_hdr_append: INFO={}", d.id));
        }
    }

    // a previous run of the same tool leaves its line behind, overwrite it in place
    bcf_hrec_t* previous = bcf_hdr_get_hrec(hdr, BCF_HL_STR, "ID", tool_name.c_str(), s_command_line_key);
    if (nullptr == previous) {
        ret = bcf_hdr_append(hdr, generate_command_line(tool_name, command_line).c_str());
    }
    else {
        std::string quoted = quote_command_line(command_line);
        int32_t idx = bcf_hrec_find_key(previous, "CommandLine");
        ret = idx < 0 ? -1 : bcf_hrec_set_val(previous, idx, quoted.c_str(), quoted.size(), 1);
    }
    if (ret != 0) {
        bcf_hdr_destroy(hdr);
        throw OutputError(fmt::format("writing output: bcf_hdr_append: {}", s_command_line_key));
    }

    ret = bcf_hdr_sync(hdr);
    if (ret != 0) {
        bcf_hdr_destroy(hdr);
        throw OutputError("writing output: bcf_hdr_sync");
    }
    return hdr;
}

bool VcfWriter::is_gz_file(const char* filename)
{
    size_t len = strlen(filename);
    if (len < 3) {
        return false;
    }
    const char* suffix = filename + len - 3;
    return strcmp(suffix, ".gz") == 0;
}

std::string VcfWriter::generate_command_line(const std::string& tool_name, const std::string& command_line)
{
    std::ostringstream oss;
    oss << "##" << s_command_line_key << "=<ID=" << tool_name << ",CommandLine=\"" << quote_command_line(command_line) << "\">";
    return oss.str();
}

std::string VcfWriter::quote_command_line(const std::string& command_line)
{
    std::string quoted = command_line;
    std::replace(quoted.begin(), quoted.end(), '"', '\'');
    return quoted;
}
