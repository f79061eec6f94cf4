// filename: board.cpp
// part of PCB to FEMM Mesh Converter
// MIT License

#include "pcbfem/board.hpp"

#include "pcbfem/errors.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace pcbfem {
namespace {

bool isDelimiter(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '(' || c == ')';
}

double parseNumber(const std::string& text, const std::string& context) {
    if (text.empty()) {
        throw InputFormatError(context + ": expected a number, found an empty string");
    }
    errno = 0;
    char* end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end != text.c_str() + text.size() || errno == ERANGE) {
        throw InputFormatError(context + ": expected a number, found '" + text + "'");
    }
    return value;
}

bool looksNumeric(const std::string& text) {
    if (text.empty()) {
        return false;
    }
    char* end = nullptr;
    std::strtod(text.c_str(), &end);
    return end == text.c_str() + text.size();
}

Point2 readXY(const SExpr& item, const std::string& context) {
    return Point2(item.number(0, context), item.number(1, context));
}

std::string netNameOf(const SExpr& item, const std::map<std::string, std::string>& nets) {
    const SExpr* net = item.child("net");
    if (net == nullptr || net->atoms.empty()) {
        return {};
    }
    if (net->atoms.size() > 1) {
        return net->atoms[1];
    }
    const auto it = nets.find(net->atoms[0]);
    return it == nets.end() ? std::string{} : it->second;
}

std::vector<std::string> layerList(const SExpr& item, const std::string& context) {
    const SExpr* layers = item.child("layers");
    if (layers == nullptr) {
        layers = &item.require("layer", context);
    }
    return layers->atoms;
}

BoardDrill readDrill(const SExpr& item, const std::string& context) {
    BoardDrill drill;
    std::size_t next = 0;
    if (!item.atoms.empty() && !looksNumeric(item.atoms[0])) {
        if (item.atoms[0] != "oval") {
            throw ConfigurationError("Unknown pad drill shape <" + item.atoms[0] + ">");
        }
        drill.shape = BoardDrill::Shape::Oval;
        next = 1;
    }
    if (item.atoms.size() > next) {
        drill.sizeX = item.number(next, context);
        drill.sizeY = item.atoms.size() > next + 1 ? item.number(next + 1, context) : drill.sizeX;
    }
    if (const SExpr* offset = item.child("offset")) {
        drill.offset = readXY(*offset, context + " offset");
    }
    return drill;
}

double readRotation(const SExpr& at, const std::string& context) {
    return at.atoms.size() > 2 ? at.number(2, context) : 0.0;
}

BoardPad readPad(const SExpr& item, const BoardComponent& owner, const std::map<std::string, std::string>& nets) {
    const std::string context = "pad in " + (owner.reference.empty() ? std::string("footprint") : owner.reference);
    BoardPad pad;
    pad.source = BoardPad::Source::Pad;
    pad.number = item.atom(0, context);
    pad.type = item.atom(1, context);
    pad.shape = item.atom(2, context);

    const SExpr& at = item.require("at", context);
    pad.at = readXY(at, context + " at");
    pad.rotation = readRotation(at, context + " at");

    const SExpr& size = item.require("size", context);
    pad.sizeX = size.number(0, context + " size");
    pad.sizeY = size.atoms.size() > 1 ? size.number(1, context + " size") : pad.sizeX;

    if (const SExpr* delta = item.child("rect_delta")) {
        pad.rectDelta = readXY(*delta, context + " rect_delta");
    }
    if (const SExpr* ratio = item.child("roundrect_rratio")) {
        pad.roundRectRatio = ratio->number(0, context + " roundrect_rratio");
    }
    if (const SExpr* drill = item.child("drill")) {
        pad.drill = readDrill(*drill, context + " drill");
    }
    pad.layers = item.require("layers", context).atoms;
    pad.netName = netNameOf(item, nets);

    pad.componentReference = owner.reference;
    pad.componentAt = owner.at;
    pad.componentRotation = owner.rotation;
    return pad;
}

std::string componentReference(const SExpr& item) {
    for (const SExpr* text : item.children_named("fp_text")) {
        if (text->atoms.size() > 1 && text->atoms[0] == "reference") {
            return text->atoms[1];
        }
    }
    for (const SExpr* property : item.children_named("property")) {
        if (property->atoms.size() > 1 && property->atoms[0] == "Reference") {
            return property->atoms[1];
        }
    }
    return {};
}

BoardComponent readComponent(const SExpr& item, const std::map<std::string, std::string>& nets) {
    BoardComponent component;
    component.reference = componentReference(item);
    const std::string context = item.keyword + " " + component.reference;
    const SExpr& at = item.require("at", context);
    component.at = readXY(at, context + " at");
    component.rotation = readRotation(at, context + " at");
    for (const SExpr* pad : item.children_named("pad")) {
        component.pads.push_back(readPad(*pad, component, nets));
    }
    return component;
}

BoardPad readVia(const SExpr& item, const std::map<std::string, std::string>& nets) {
    const std::string context = "via";
    BoardPad via;
    via.source = BoardPad::Source::Via;
    via.type = "thru_hole";
    via.shape = "circle";
    via.at = readXY(item.require("at", context), context + " at");
    via.sizeX = item.require("size", context).number(0, context + " size");
    via.sizeY = via.sizeX;
    via.drill = readDrill(item.require("drill", context), context + " drill");
    via.layers = item.require("layers", context).atoms;
    via.netName = netNameOf(item, nets);
    return via;
}

BoardTrace readTrace(const SExpr& item, const std::map<std::string, std::string>& nets) {
    const std::string context = "segment";
    BoardTrace trace;
    trace.start = readXY(item.require("start", context), context + " start");
    trace.end = readXY(item.require("end", context), context + " end");
    trace.width = item.require("width", context).number(0, context + " width");
    trace.layer = item.require("layer", context).atom(0, context + " layer");
    trace.netName = netNameOf(item, nets);
    return trace;
}

BoardZone readZone(const SExpr& item, const std::map<std::string, std::string>& nets) {
    const std::string context = "zone";
    BoardZone zone;
    zone.netName = netNameOf(item, nets);
    zone.minThickness = item.require("min_thickness", context).number(0, context + " min_thickness");

    const std::vector<std::string> zoneLayers = layerList(item, context);
    for (const SExpr* filled : item.children_named("filled_polygon")) {
        BoardZoneFill fill;
        if (const SExpr* layer = filled->child("layer")) {
            fill.layer = layer->atom(0, "filled_polygon layer");
        } else if (!zoneLayers.empty()) {
            fill.layer = zoneLayers.front();
        } else {
            throw InputFormatError("filled_polygon has no layer");
        }
        for (const SExpr& point : filled->require("pts", "filled_polygon").children) {
            if (point.keyword != "xy") {
                continue;
            }
            fill.points.push_back(readXY(point, "filled_polygon xy"));
        }
        zone.fills.push_back(std::move(fill));
    }
    return zone;
}

}  // namespace

const SExpr* SExpr::child(const std::string& name) const {
    for (const SExpr& item : children) {
        if (item.keyword == name) {
            return &item;
        }
    }
    return nullptr;
}

std::vector<const SExpr*> SExpr::children_named(const std::string& name) const {
    std::vector<const SExpr*> out;
    for (const SExpr& item : children) {
        if (item.keyword == name) {
            out.push_back(&item);
        }
    }
    return out;
}

const SExpr& SExpr::require(const std::string& name, const std::string& context) const {
    const SExpr* item = child(name);
    if (item == nullptr) {
        throw InputFormatError(context + ": missing required item '" + name + "'");
    }
    return *item;
}

const std::string& SExpr::atom(std::size_t index, const std::string& context) const {
    if (index >= atoms.size()) {
        throw InputFormatError(context + ": expected at least " + std::to_string(index + 1) + " parameters in '" +
                               keyword + "'");
    }
    return atoms[index];
}

double SExpr::number(std::size_t index, const std::string& context) const {
    return parseNumber(atom(index, context), context);
}

SExpr parseSExpression(const std::string& text) {
    std::size_t pos = text.find('(');
    if (pos == std::string::npos) {
        throw InputFormatError("Root item start token '(' not found");
    }

    std::vector<SExpr> stack;
    const auto openItem = [&]() {
        ++pos;
        const std::size_t begin = pos;
        while (pos < text.size() && !isDelimiter(text[pos])) {
            ++pos;
        }
        if (pos == begin) {
            throw InputFormatError("Item with an empty keyword at offset " + std::to_string(begin));
        }
        SExpr item;
        item.keyword = text.substr(begin, pos - begin);
        stack.push_back(std::move(item));
    };

    openItem();
    while (pos < text.size()) {
        const char c = text[pos];
        if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
            ++pos;
        } else if (c == '(') {
            openItem();
        } else if (c == ')') {
            ++pos;
            SExpr done = std::move(stack.back());
            stack.pop_back();
            if (stack.empty()) {
                return done;
            }
            stack.back().children.push_back(std::move(done));
        } else if (c == '"') {
            ++pos;
            std::string value;
            bool closed = false;
            while (pos < text.size()) {
                const char q = text[pos++];
                if (q == '\\' && pos < text.size() && (text[pos] == '"' || text[pos] == '\\')) {
                    value += text[pos++];
                } else if (q == '"') {
                    if (pos < text.size() && text[pos] == '"') {
                        value += '"';
                        ++pos;
                    } else {
                        closed = true;
                        break;
                    }
                } else {
                    value += q;
                }
            }
            if (!closed) {
                throw InputFormatError("Unterminated quoted string in '" + stack.back().keyword + "'");
            }
            // Anything glued to a closing quote is dropped.
            while (pos < text.size() && !isDelimiter(text[pos])) {
                ++pos;
            }
            stack.back().atoms.push_back(std::move(value));
        } else {
            const std::size_t begin = pos;
            while (pos < text.size() && !isDelimiter(text[pos])) {
                ++pos;
            }
            stack.back().atoms.push_back(text.substr(begin, pos - begin));
        }
    }
    throw InputFormatError("Unbalanced parentheses: '" + stack.back().keyword + "' is never closed");
}

bool BoardPad::has_layer(const std::string& layer) const {
    const std::size_t dot = layer.find('.');
    const std::string matchName = layer.substr(0, dot);
    const std::string matchType = dot == std::string::npos ? std::string{} : layer.substr(dot + 1);

    for (const std::string& own : layers) {
        const std::size_t ownDot = own.find('.');
        const std::string name = own.substr(0, ownDot);
        const std::string type = ownDot == std::string::npos ? std::string{} : own.substr(ownDot + 1);
        if (type != matchType) {
            continue;
        }
        if (name == "*" || name == matchName) {
            return true;
        }
        if (name == "F&B" && (matchName == "F" || matchName == "B")) {
            return true;
        }
    }
    return false;
}

Board boardFromSExpr(const SExpr& root) {
    if (root.keyword != "kicad_pcb") {
        throw InputFormatError("Expected a 'kicad_pcb' root item, found '" + root.keyword + "'");
    }

    Board board;
    for (const SExpr* net : root.children_named("net")) {
        if (net->atoms.size() >= 2) {
            board.nets[net->atoms[0]] = net->atoms[1];
        } else if (net->atoms.size() == 1) {
            board.nets[net->atoms[0]] = std::string{};
        }
    }

    for (const SExpr& item : root.children) {
        if (item.keyword == "module" || item.keyword == "footprint") {
            board.components.push_back(readComponent(item, board.nets));
        } else if (item.keyword == "via") {
            board.vias.push_back(readVia(item, board.nets));
        } else if (item.keyword == "segment") {
            board.traces.push_back(readTrace(item, board.nets));
        } else if (item.keyword == "zone") {
            board.zones.push_back(readZone(item, board.nets));
        }
    }
    return board;
}

Board loadBoardFromKicad(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw std::runtime_error("Failed to open board file: " + path);
    }
    std::ostringstream contents;
    contents << input.rdbuf();
    return boardFromSExpr(parseSExpression(contents.str()));
}

}  // namespace pcbfem
