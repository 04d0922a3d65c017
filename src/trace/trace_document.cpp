#include "trace/trace_document.h"
#include "common/errors.h"
#include <libxml/parser.h>
#include <cmath>
#include <cstdlib>
#include <stdexcept>

namespace dts {
namespace {

bool is_element(const xmlNode* node, const char* name) {
    return node->type == XML_ELEMENT_NODE &&
           xmlStrEqual(node->name, reinterpret_cast<const xmlChar*>(name));
}

bool get_attr(const xmlNode* node, const char* name, std::string& out) {
    xmlChar* value = xmlGetProp(node, reinterpret_cast<const xmlChar*>(name));
    if (!value)
        return false;
    out = reinterpret_cast<const char*>(value);
    xmlFree(value);
    return true;
}

std::string require_attr(const xmlNode* node, const char* name) {
    std::string value;
    if (!get_attr(node, name, value))
        throw SimError(ErrorKind::MALFORMED_INPUT,
                       "line " + std::to_string(xmlGetLineNo(node)) + ": <" +
                       reinterpret_cast<const char*>(node->name) +
                       "> missing attribute '" + name + "'");
    return value;
}

double to_number(const xmlNode* node, const char* name, const std::string& text) {
    char* end = nullptr;
    double v = std::strtod(text.c_str(), &end);
    if (text.empty() || *end != '\0' || !std::isfinite(v))
        throw SimError(ErrorKind::MALFORMED_INPUT,
                       "line " + std::to_string(xmlGetLineNo(node)) + ": attribute '" +
                       name + "' is not a number: '" + text + "'");
    return v;
}

double require_number(const xmlNode* node, const char* name) {
    return to_number(node, name, require_attr(node, name));
}

void set_attr(xmlNode* node, const char* name, const std::string& value) {
    xmlSetProp(node, reinterpret_cast<const xmlChar*>(name),
               reinterpret_cast<const xmlChar*>(value.c_str()));
}

// Blank text is dropped so saved documents are re-indented uniformly
const int PARSE_OPTIONS = XML_PARSE_NONET | XML_PARSE_NOBLANKS | XML_PARSE_NOWARNING | XML_PARSE_NOERROR;

} // anonymous namespace

int64_t tick_of_time(double time) {
    // Truncation must stay inside int64 with room for the offset
    if (!(time > -9.0e18 && time < 9.0e18))
        throw SimError(ErrorKind::MALFORMED_INPUT, "timestep time out of range: " + format_number(time));
    return static_cast<int64_t>(time) + TICK_OFFSET;
}

TraceDocument::TraceDocument(xmlDoc* doc) : doc_(doc) {}

TraceDocument TraceDocument::load_file(const std::string& path) {
    xmlDoc* doc = xmlReadFile(path.c_str(), nullptr, PARSE_OPTIONS);
    if (!doc)
        throw SimError(ErrorKind::MALFORMED_INPUT, "cannot parse trace file: " + path);
    TraceDocument out(doc);
    if (!xmlDocGetRootElement(doc))
        throw SimError(ErrorKind::MALFORMED_INPUT, "trace file has no root element: " + path);
    return out;
}

TraceDocument TraceDocument::load_string(const std::string& xml) {
    xmlDoc* doc = xmlReadMemory(xml.data(), static_cast<int>(xml.size()),
                                "trace.xml", nullptr, PARSE_OPTIONS);
    if (!doc)
        throw SimError(ErrorKind::MALFORMED_INPUT, "cannot parse trace text");
    TraceDocument out(doc);
    if (!xmlDocGetRootElement(doc))
        throw SimError(ErrorKind::MALFORMED_INPUT, "trace text has no root element");
    return out;
}

TraceDocument TraceDocument::clone() const {
    xmlDoc* copy = xmlCopyDoc(doc_.get(), 1);
    if (!copy)
        throw std::runtime_error("cannot copy trace document");
    return TraceDocument(copy);
}

std::vector<xmlNode*> TraceDocument::timestep_nodes() const {
    std::vector<xmlNode*> out;
    xmlNode* root = xmlDocGetRootElement(doc_.get());
    if (!root)
        return out;
    for (xmlNode* n = root->children; n; n = n->next) {
        if (is_element(n, "timestep"))
            out.push_back(n);
    }
    return out;
}

std::vector<TimestepRecord> TraceDocument::read_records() const {
    std::vector<TimestepRecord> out;
    for (xmlNode* step : timestep_nodes()) {
        TimestepRecord rec;
        rec.time = require_number(step, "time");
        rec.tick = tick_of_time(rec.time);

        for (xmlNode* n = step->children; n; n = n->next) {
            if (!is_element(n, "vehicle"))
                continue;
            VehicleRecord v;
            v.id = require_attr(n, "id");
            v.sample.tick  = rec.tick;
            v.sample.x     = require_number(n, "x");
            v.sample.y     = require_number(n, "y");
            v.sample.angle = require_number(n, "angle");
            v.type = require_attr(n, "type");
            v.sample.speed = require_number(n, "speed");
            v.sample.pos   = require_number(n, "pos");
            v.sample.lane  = require_attr(n, "lane");
            v.sample.slope = require_number(n, "slope");
            rec.vehicles.push_back(std::move(v));
        }
        out.push_back(std::move(rec));
    }
    return out;
}

void TraceDocument::replace_vehicles(const std::map<int64_t, std::vector<VehicleRecord>>& by_tick) {
    for (xmlNode* step : timestep_nodes()) {
        xmlNode* n = step->children;
        while (n) {
            xmlNode* next = n->next;
            if (is_element(n, "vehicle")) {
                xmlUnlinkNode(n);
                xmlFreeNode(n);
            }
            n = next;
        }

        const int64_t tick = tick_of_time(require_number(step, "time"));
        auto it = by_tick.find(tick);
        if (it == by_tick.end())
            continue;

        for (const auto& v : it->second) {
            xmlNode* el = xmlNewChild(step, nullptr, reinterpret_cast<const xmlChar*>("vehicle"), nullptr);
            set_attr(el, "id", v.id);
            set_attr(el, "x", format_number(v.sample.x));
            set_attr(el, "y", format_number(v.sample.y));
            set_attr(el, "angle", format_number(v.sample.angle));
            set_attr(el, "type", v.type);
            set_attr(el, "speed", format_number(v.sample.speed));
            set_attr(el, "pos", format_number(v.sample.pos));
            set_attr(el, "lane", v.sample.lane);
            set_attr(el, "slope", format_number(v.sample.slope));
        }
    }
}

void TraceDocument::transform_positions(const std::function<void(double& x, double& y)>& fn) {
    for (xmlNode* step : timestep_nodes()) {
        for (xmlNode* n = step->children; n; n = n->next) {
            if (!is_element(n, "vehicle"))
                continue;
            double x = require_number(n, "x");
            double y = require_number(n, "y");
            fn(x, y);
            set_attr(n, "x", format_number(x));
            set_attr(n, "y", format_number(y));
        }
    }
}

TraceBounds TraceDocument::bounds() const {
    TraceBounds b;
    for (xmlNode* step : timestep_nodes()) {
        for (xmlNode* n = step->children; n; n = n->next) {
            if (!is_element(n, "vehicle"))
                continue;
            double x = require_number(n, "x");
            double y = require_number(n, "y");
            if (b.empty) {
                b.min_x = b.max_x = x;
                b.min_y = b.max_y = y;
                b.empty = false;
                continue;
            }
            if (x < b.min_x) b.min_x = x;
            if (x > b.max_x) b.max_x = x;
            if (y < b.min_y) b.min_y = y;
            if (y > b.max_y) b.max_y = y;
        }
    }
    return b;
}

std::size_t TraceDocument::timestep_count() const {
    return timestep_nodes().size();
}

void TraceDocument::save_file(const std::string& path) const {
    if (xmlSaveFormatFileEnc(path.c_str(), doc_.get(), "UTF-8", 1) < 0)
        throw std::runtime_error("Cannot write trace file: " + path);
}

std::string TraceDocument::to_string() const {
    xmlChar* buf = nullptr;
    int size = 0;
    xmlDocDumpFormatMemoryEnc(doc_.get(), &buf, &size, "UTF-8", 1);
    if (!buf)
        throw std::runtime_error("Cannot serialize trace document");
    std::string out(reinterpret_cast<const char*>(buf), static_cast<std::size_t>(size));
    xmlFree(buf);
    return out;
}

} // namespace dts
