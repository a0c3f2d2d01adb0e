// MakeMKV robot mode ripper
// Copyright (c) The mkvrip authors.
// Under MIT.

#include <sstream>
#include <string>
#include <variant>

#include "internal.h"
#include "robot.h"

using namespace mkvrip::detail;

/* ------------------------------------------------------------------- */
/* Use static linkage for file local definitions */

static const char* media_kind_name(MediaKind kind) {
    switch (kind) {
        case MediaKind::kCD: return "CD";
        case MediaKind::kDVD: return "DVD";
        case MediaKind::kBluRay: return "BluRay";
        default: return "Unknown";
    }
}

static void write_params(std::ostringstream& oss, const Message& m) {
    oss << " params=[";
    for (size_t i = 0; i < m.params.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "\"" << m.params[i] << "\"";
    }
    oss << "]";
}

struct Describer {
    std::ostringstream& oss;

    void operator()(const Drive& d) const {
        oss << "index=" << d.index
            << " mount=\"" << d.mount << "\""
            << " disc=\"" << d.disc_label << "\""
            << " name=\"" << d.firmware_name << "\""
            << " visible=" << d.visibility_code
            << " attached=" << d.attached
            << " loaded=" << d.loaded
            << " open=" << d.tray_open
            << " media=" << media_kind_name(d.media_kind);
    }
    void operator()(const Message& m) const {
        oss << "code=" << m.code << " flags=" << m.flags
            << " text=\"" << m.text << "\"";
        write_params(oss, m);
    }
    void operator()(const ErrorMessage& m) const {
        oss << "ERROR code=" << m.code << " error=\"" << m.error << "\""
            << " text=\"" << m.text << "\"";
        write_params(oss, m);
    }
    void operator()(const TitleCount& c) const {
        oss << "count=" << c.count;
    }
    void operator()(const DiscInfo& i) const {
        oss << "id=" << i.id << " code=" << i.code << " value=\"" << i.value << "\"";
    }
    void operator()(const TitleInfo& i) const {
        oss << "title=" << i.title_id << " ";
        (*this)(static_cast<const DiscInfo&>(i));
    }
    void operator()(const StreamInfo& i) const {
        oss << "title=" << i.title_id << " stream=" << i.stream_id << " ";
        (*this)(static_cast<const DiscInfo&>(i));
    }
    void operator()(const ProgressValues& v) const {
        oss << v.current << "/" << v.total << " of " << v.maximum;
    }
    void operator()(const ProgressTitle& t) const {
        oss << "code=" << t.code << " op=" << t.op_id << " name=\"" << t.name << "\"";
    }
};

/* ------------------------------------------------------------------- */
/* Exported API functions */

extern "C" {

const char* mkvrip_describe_line(
    const char* line,
    const char** error) {

    clear_error(error);
    if (!line) {
        set_error(error, "Line is required");
        return nullptr;
    }

    Record record;
    std::string err;
    if (!decode_line(line, record, err)) {
        set_error(error, err);
        return nullptr;
    }

    std::ostringstream oss;
    oss << output_type_name(record_type(record)) << " ";
    std::visit(Describer{oss}, record);
    return make_cstr_copy(oss.str());
}

void mkvrip_release_description(const char* p) {
    delete[] p;
}

};
