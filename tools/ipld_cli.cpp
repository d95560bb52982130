
#include "ipld/file.hpp"
#include "ipld/ipld_easy.hpp"
#include "ipld/value.hpp"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

// FTXUI TUI
#include <ftxui/component/component.hpp>
#include <ftxui/component/event.hpp>
#include <ftxui/component/component_base.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <ftxui/dom/elements.hpp>
#include <ftxui/screen/terminal.hpp>

#if !defined(_WIN32)
#include <unistd.h>
#endif


namespace {

struct Ansi {
    bool enabled{true};

    std::string reset() const { return enabled ? "\x1b[0m" : ""; }
    std::string dim() const { return enabled ? "\x1b[2m" : ""; }
    std::string bold() const { return enabled ? "\x1b[1m" : ""; }
    std::string red() const { return enabled ? "\x1b[31m" : ""; }
    std::string green() const { return enabled ? "\x1b[32m" : ""; }
    std::string yellow() const { return enabled ? "\x1b[33m" : ""; }
    std::string magenta() const { return enabled ? "\x1b[35m" : ""; }
    std::string cyan() const { return enabled ? "\x1b[36m" : ""; }
    std::string gray() const { return enabled ? "\x1b[90m" : ""; }
};

static bool is_tty() {
#if defined(_WIN32)
    return false;
#else
    return ::isatty(fileno(stdout));
#endif
}

static std::string hex8(std::uint32_t v) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << v;
    return oss.str();
}

static void usage() {
    std::cerr <<
        "ipld (C++) - DAG-CBOR block inspector\n"
        "\n"
        "Usage:\n"
        "  ipld info <FILE> [--inflate] [--no-color]\n"
        "  ipld tree <FILE> [--prefix <P>] [--max-depth N] [--max-elems N] [--inflate] [--no-color]\n"
        "  ipld diag <FILE> [--inflate]\n"
        "  ipld show <FILE> [<PATH>] [--max-elems N] [--inflate] [--no-color]\n"
        "\n"
        "PATH and --prefix are '/'-separated map keys or list indices, e.g. items/0/name.\n";
}

struct Args {
    std::string cmd;
    std::string file;
    std::string path;
    bool inflate{false};
    bool no_color{false};
    std::string prefix;
    std::size_t max_depth{static_cast<std::size_t>(-1)};
    std::size_t max_elems{20};
};

static bool parse_args(int argc, char** argv, Args& a) {
    if (argc < 3) return false;
    a.cmd = argv[1];
    a.file = argv[2];

    int i = 3;
    // positional path for show
    if (a.cmd == "show" && i < argc && std::string(argv[i]).rfind("--", 0) != 0) {
        a.path = argv[i++];
    }

    while (i < argc) {
        std::string opt = argv[i++];
        if (opt == "--inflate") a.inflate = true;
        else if (opt == "--no-color") a.no_color = true;
        else if (opt == "--prefix" && i < argc) a.prefix = argv[i++];
        else if (opt == "--max-depth" && i < argc) a.max_depth = static_cast<std::size_t>(std::stoull(argv[i++]));
        else if (opt == "--max-elems" && i < argc) a.max_elems = static_cast<std::size_t>(std::stoull(argv[i++]));
        else {
            std::cerr << "Unknown option: " << opt << "\n";
            return false;
        }
    }

    if (a.cmd != "info" && a.cmd != "tree" && a.cmd != "diag" && a.cmd != "show") {
        std::cerr << "Unknown command: " << a.cmd << "\n";
        return false;
    }
    return true;
}

// ----------------- Value helpers -----------------

static std::size_t value_size(const ipld::Value& v) {
    switch (v.kind()) {
        case ipld::ValueKind::String: return v.as_string().size();
        case ipld::ValueKind::Bytes: return v.as_bytes().size();
        case ipld::ValueKind::List: return v.as_list().size();
        case ipld::ValueKind::Map: return v.as_map().size();
        case ipld::ValueKind::Link: return v.as_link().bytes.size();
        default: return 0;
    }
}

static bool is_container(const ipld::Value& v) {
    return v.is_list() || v.is_map();
}

static std::string clip(std::string s, std::size_t max_len) {
    if (s.size() <= max_len) return s;
    s.resize(max_len > 3 ? max_len - 3 : max_len);
    return s + "...";
}

// One-line label used by the tree printer and the browser.
static std::string summary(const ipld::Value& v) {
    switch (v.kind()) {
        case ipld::ValueKind::List: return "list[" + std::to_string(v.as_list().size()) + "]";
        case ipld::ValueKind::Map: return "map{" + std::to_string(v.as_map().size()) + "}";
        case ipld::ValueKind::Bytes: return "bytes[" + std::to_string(v.as_bytes().size()) + "]";
        default: return clip(ipld::to_diag(v), 40);
    }
}

static std::string join_path(const std::string& parent, const std::string& part) {
    return parent.empty() ? part : parent + "/" + part;
}

// nullptr when a segment names no map key or list index.
static const ipld::Value* find_path(const ipld::Value& root, const std::string& path) {
    const ipld::Value* cur = &root;
    std::size_t start = 0;
    while (start <= path.size()) {
        auto slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        std::string part = path.substr(start, slash - start);
        if (!part.empty()) {
            if (cur->is_map()) {
                const auto& m = cur->as_map();
                auto it = m.find(part);
                if (it == m.end()) return nullptr;
                cur = &it->second;
            } else if (cur->is_list()) {
                if (part.find_first_not_of("0123456789") != std::string::npos) return nullptr;
                const auto& l = cur->as_list();
                const std::size_t idx = static_cast<std::size_t>(std::stoull(part));
                if (idx >= l.size()) return nullptr;
                cur = &l[idx];
            } else {
                return nullptr;
            }
        }
        if (slash == path.size()) break;
        start = slash + 1;
    }
    return cur;
}

// ----------------- Tree printer -----------------

static void print_tree(
    const ipld::Value& node,
    const Ansi& ansi,
    std::size_t indent,
    std::size_t depth,
    std::size_t max_depth,
    std::size_t max_elems
) {
    if (depth > max_depth) return;

    auto print_child = [&](const std::string& name, const ipld::Value& child) {
        std::string pad(indent, ' ');
        if (is_container(child)) {
            std::cout << pad
                      << ansi.magenta() << name << "/" << ansi.reset()
                      << " " << ansi.gray() << summary(child) << ansi.reset()
                      << "\n";
            print_tree(child, ansi, indent + 2, depth + 1, max_depth, max_elems);
            return;
        }
        std::cout << pad
                  << ansi.cyan() << name << ansi.reset()
                  << " " << ansi.yellow() << ipld::to_string(child.kind()) << ansi.reset()
                  << " " << (child.is_link() ? ansi.green() : ansi.gray()) << summary(child) << ansi.reset()
                  << "\n";
    };

    std::size_t shown = 0;
    std::size_t total = 0;
    if (node.is_map()) {
        const auto& m = node.as_map();
        total = m.size();
        for (const auto& kv : m) {
            if (shown == max_elems) break;
            print_child(kv.first, kv.second);
            ++shown;
        }
    } else if (node.is_list()) {
        const auto& l = node.as_list();
        total = l.size();
        for (std::size_t i = 0; i < l.size() && shown < max_elems; ++i, ++shown) {
            print_child("[" + std::to_string(i) + "]", l[i]);
        }
    }
    if (shown < total) {
        std::cout << std::string(indent, ' ') << ansi.dim() << "... " << (total - shown) << " more" << ansi.reset() << "\n";
    }
}


// ----------------- Interactive UI tree (FTXUI) -----------------

struct UiNode {
    std::string name;
    std::string full_path; // '/'-separated; empty for root
    const ipld::Value* value{nullptr};
    std::vector<UiNode> children;
    std::size_t hidden{0}; // entries beyond --max-elems
};

struct UiRow {
    const UiNode* node{nullptr};
    int depth{0};
    bool is_dir{false};
    bool is_leaf{false};
};

static void ui_build(UiNode& node, const ipld::Value& v, std::size_t max_elems) {
    node.value = &v;
    auto add = [&](std::string name, std::string seg, const ipld::Value& child) {
        UiNode n;
        n.name = std::move(name);
        n.full_path = join_path(node.full_path, seg);
        ui_build(n, child, max_elems);
        node.children.push_back(std::move(n));
    };

    if (v.is_map()) {
        const auto& m = v.as_map();
        for (const auto& kv : m) {
            if (node.children.size() == max_elems) break;
            add(kv.first, kv.first, kv.second);
        }
        node.hidden = m.size() - node.children.size();
    } else if (v.is_list()) {
        const auto& l = v.as_list();
        for (std::size_t i = 0; i < l.size() && i < max_elems; ++i) {
            add("[" + std::to_string(i) + "]", std::to_string(i), l[i]);
        }
        node.hidden = l.size() - node.children.size();
    }
}

static const UiNode* ui_find(const UiNode& root, const std::string& path) {
    if (path.empty()) return &root;
    for (const auto& child : root.children) {
        if (child.full_path == path) return &child;
        if (path.rfind(child.full_path + "/", 0) == 0) return ui_find(child, path);
    }
    return nullptr;
}

static void flatten_rows(const UiNode& node,
                         const std::set<std::string>& expanded,
                         int depth,
                         std::vector<UiRow>& out) {
    // Root itself is not rendered; render its children.
    for (const auto& child : node.children) {
        bool is_dir = !child.children.empty();
        out.push_back(UiRow{&child, depth, is_dir, !is_dir});

        if (is_dir && expanded.find(child.full_path) != expanded.end()) {
            flatten_rows(child, expanded, depth + 1, out);
        }
    }
}

// ----------------- Value preview -----------------

static void print_value_preview(std::ostream& os, const ipld::Value& v, std::size_t max_elems) {
    switch (v.kind()) {
        case ipld::ValueKind::Map: {
            const auto& m = v.as_map();
            os << "map:\n";
            os << "  entries=" << m.size() << "\n";
            os << "preview:\n";
            std::size_t shown = 0;
            for (const auto& kv : m) {
                if (shown++ == max_elems) break;
                os << "  " << kv.first << "=" << summary(kv.second) << "\n";
            }
            return;
        }
        case ipld::ValueKind::List: {
            const auto& l = v.as_list();
            os << "list:\n";
            os << "  length=" << l.size() << "\n";
            os << "preview:\n";
            for (std::size_t i = 0; i < l.size() && i < max_elems; ++i) {
                os << "  [" << i << "]=" << summary(l[i]) << "\n";
            }
            return;
        }
        case ipld::ValueKind::String:
            os << "string:\n";
            os << "  length=" << v.as_string().size() << "\n";
            os << "preview:\n";
            os << "  " << ipld::to_diag(v) << "\n";
            return;
        case ipld::ValueKind::Bytes: {
            const auto& b = v.as_bytes();
            const std::size_t show = std::min(b.size(), max_elems * 4);
            os << "bytes:\n";
            os << "  length=" << b.size() << "\n";
            os << "  hex=" << ipld::easy::to_hex(b.data(), show) << (show < b.size() ? "..." : "") << "\n";
            return;
        }
        case ipld::ValueKind::Link: {
            const auto& c = v.as_link();
            os << "link:\n";
            os << "  tag=" << ipld::kCidTag << "\n";
            os << "  length=" << c.bytes.size() << "\n";
            os << "  cid=" << ipld::easy::to_hex(c.bytes) << "\n";
            return;
        }
        default:
            os << ipld::to_string(v.kind()) << ": " << ipld::to_diag(v) << "\n";
            return;
    }
}

static std::string preview_to_string(const ipld::Value& v, std::size_t max_elems) {
    std::ostringstream oss;
    print_value_preview(oss, v, max_elems);
    return oss.str();
}

// --- Preview rendering helpers for FTXUI ---
static std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    for (char ch : s) {
        if (ch == '\r') continue;
        if (ch == '\n') {
            out.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(ch);
        }
    }
    if (!cur.empty()) out.push_back(cur);
    return out;
}

static ftxui::Element render_preview_colored(const std::string& preview) {
    using namespace ftxui;

    auto lines = split_lines(preview);
    if (lines.empty()) {
        return text("(no preview)") | color(Color::GrayDark);
    }

    std::vector<Element> els;
    els.reserve(lines.size());

    for (const auto& line : lines) {
        // Section headers like "map:" / "preview:"
        if (!line.empty() && line.back() == ':' && line.rfind("  ", 0) != 0) {
            els.push_back(text(line) | bold | color(Color::Magenta));
            continue;
        }

        // Indented key/value like "  length=3"
        if (line.rfind("  ", 0) == 0) {
            std::string rest = line.substr(2);
            if (!rest.empty() && rest.front() == '"') {
                els.push_back(hbox({text("  "), text(rest) | color(Color::Green)}));
                continue;
            }
            auto eq = rest.find('=');
            if (eq != std::string::npos) {
                els.push_back(hbox({
                    text("  "),
                    text(rest.substr(0, eq)) | bold | color(Color::Yellow),
                    text("=") | color(Color::GrayDark),
                    text(rest.substr(eq + 1)) | color(Color::GrayLight) | flex,
                }));
                continue;
            }
            els.push_back(text(line) | color(Color::White));
            continue;
        }

        // One-liners like "integer: 42"
        auto colon = line.find(':');
        if (colon != std::string::npos && colon < 32) {
            els.push_back(hbox({
                text(line.substr(0, colon + 1)) | bold | color(Color::Magenta),
                text(line.substr(colon + 1)) | color(Color::White) | flex,
            }));
            continue;
        }

        els.push_back(text(line) | color(Color::White));
    }

    return vbox(std::move(els));
}

static const UiRow* safe_row_at(const std::vector<UiRow>& rows, int idx) {
    if (idx < 0 || static_cast<std::size_t>(idx) >= rows.size()) return nullptr;
    return &rows[static_cast<std::size_t>(idx)];
}

static int run_show(const Args& a, const ipld::Value& root_value, const Ansi& ansi) {
    UiNode root;
    root.name = "<root>";
    ui_build(root, root_value, a.max_elems);

    const UiNode* start = &root;
    if (!a.path.empty() && a.path != "<root>") {
        const UiNode* found = ui_find(root, a.path);
        if (!found) {
            std::cerr << ansi.red() << "Error" << ansi.reset() << ": path not found: " << a.path << "\n";
            return 2;
        }
        start = found;
    }

    using namespace ftxui;

    std::set<std::string> expanded;

    int selected = 0;
    int left_scroll = 0; // first visible row index in left pane

    struct StatusKV {
        std::string k;
        std::string v;
    };
    std::vector<StatusKV> status_kv;

    std::string preview = preview_to_string(*start->value, a.max_elems);
    std::string selected_path = start->full_path;

    auto rebuild = [&]() -> std::vector<UiRow> {
        std::vector<UiRow> out;
        flatten_rows(*start, expanded, 0, out);
        if (out.empty()) {
            selected = 0;
        } else {
            selected = std::max(0, std::min(selected, static_cast<int>(out.size()) - 1));
        }
        return out;
    };

    auto rows = rebuild();

    auto load_preview_for_selected = [&]() {
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr || !pr->node || !pr->node->value) return;
        const UiNode& n = *pr->node;
        const ipld::Value& v = *n.value;
        selected_path = n.full_path;
        preview = preview_to_string(v, a.max_elems);

        status_kv.clear();
        status_kv.push_back({"kind", ipld::to_string(v.kind())});
        if (is_container(v) || v.is_string() || v.is_bytes() || v.is_link()) {
            status_kv.push_back({"size", std::to_string(value_size(v))});
        }
        if (n.hidden) status_kv.push_back({"hidden", std::to_string(n.hidden)});
        if (v.is_link()) status_kv.push_back({"tag", std::to_string(ipld::kCidTag)});
    };

    load_preview_for_selected();

    auto left_pane = Renderer([&] {
        rows = rebuild();

        // Scroll inside the pane; the UI height is clamped to the terminal.
        auto dim = ftxui::Terminal::Size();
        int term_h = std::max(10, dim.dimy);

        // header (1) + separator (1) + border (2) + a bit of margin
        int visible_rows = std::max(3, term_h - 6);

        int total = static_cast<int>(rows.size());
        if (total <= 0) {
            left_scroll = 0;
        } else {
            left_scroll = std::max(0, std::min(left_scroll, std::max(0, total - visible_rows)));
            if (selected < left_scroll) left_scroll = selected;
            if (selected >= left_scroll + visible_rows) left_scroll = selected - visible_rows + 1;
        }

        int begin = left_scroll;
        int end = std::min(total, begin + visible_rows);

        std::vector<Element> items;

        constexpr int kLeftLineMax = 58; // pane width is 60, leave room for borders

        if (begin > 0) {
            items.push_back(text("↑ more") | color(Color::GrayDark));
        }

        for (int i = begin; i < end; ++i) {
            const UiRow& r = rows[static_cast<std::size_t>(i)];
            const UiNode* n = r.node;

            std::string glyph = "• ";
            if (r.is_dir) glyph = (expanded.find(n->full_path) != expanded.end()) ? "▾ " : "▸ ";

            std::string indent(static_cast<std::size_t>(r.depth) * 2, ' ');
            std::string meta = summary(*n->value);
            if (n->hidden) meta += " +" + std::to_string(n->hidden);

            Color name_color = r.is_dir ? Color::Magenta : Color::Cyan;
            Color meta_color = n->value->is_link() ? Color::Green : Color::Yellow;

            Element line = hbox({
                text(indent + glyph + n->name) | color(name_color) | flex,
                text(meta) | color(meta_color),
            }) | size(WIDTH, LESS_THAN, kLeftLineMax);

            if (i == selected) {
                line = line | inverted;
            }
            items.push_back(line);
        }

        if (end < total) {
            items.push_back(text("↓ more") | color(Color::GrayDark));
        }

        auto header = hbox({
            text("IPLD") | bold | color(Color::White),
            text("  "),
            text(a.file) | color(Color::GrayDark),
            filler(),
            text("q") | bold | color(Color::Yellow),
            text(" quit  ") | color(Color::GrayDark),
            text("←→") | bold | color(Color::Yellow),
            text(" collapse/expand  ") | color(Color::GrayDark),
            text("↑↓") | bold | color(Color::Yellow),
            text(" move  ") | color(Color::GrayDark),
            text("Enter") | bold | color(Color::Yellow),
            text(" preview") | color(Color::GrayDark)
        });

        return vbox({
                   header,
                   separator(),
                   vbox(std::move(items)) | flex,
               }) |
               flex |
               border;
    });

    auto right_pane = Renderer([&] {
        std::vector<Element> meta_lines;
        for (const auto& kv : status_kv) {
            meta_lines.push_back(
                hbox({
                    text(kv.k) | bold | color(Color::Yellow),
                    text(": ") | color(Color::GrayDark),
                    text(kv.v) | color(Color::GrayLight) | flex,
                })
            );
        }
        if (meta_lines.empty()) {
            meta_lines.push_back(text("(no metadata)") | color(Color::GrayDark));
        }

        Element top = vbox({
            text(selected_path.empty() ? "<root>" : selected_path) | bold | color(Color::Green),
            separator(),
            vbox(std::move(meta_lines)) | flex,
        }) | vscroll_indicator | frame | size(HEIGHT, LESS_THAN, 10) | flex;

        Element body = vbox({
            text("preview") | bold | color(Color::Magenta),
            separator(),
            render_preview_colored(preview) | flex,
        }) | vscroll_indicator | frame | flex;

        return vbox({top, separator(), body}) |
               flex |
               border;
    });

    auto layout = Renderer([&] {
        int left_w = 60;

        auto dim = ftxui::Terminal::Size();
        int term_w = std::max(20, dim.dimx);
        int term_h = std::max(10, dim.dimy);

        auto ui = hbox({
            left_pane->Render() | size(WIDTH, EQUAL, left_w),
            right_pane->Render() | flex,
        }) | flex;

        return ui
            | size(WIDTH, EQUAL, term_w)
            | size(HEIGHT, EQUAL, term_h);
    });

    auto screen = ScreenInteractive::TerminalOutput();
    screen.TrackMouse(true);

    auto app = CatchEvent(layout, [&](Event e) {
        rows = rebuild();

        if (e == Event::Character('q') || e == Event::Escape) {
            screen.Exit();
            return true;
        }
        const UiRow* pr = safe_row_at(rows, selected);
        if (!pr) return false;
        const UiRow& r = *pr;

        if (e == Event::ArrowUp) {
            if (selected > 0) selected--;
            return true;
        }
        if (e == Event::ArrowDown) {
            if (selected + 1 < static_cast<int>(rows.size())) selected++;
            return true;
        }
        if (e == Event::PageUp) {
            selected = std::max(0, selected - 25);
            return true;
        }
        if (e == Event::PageDown) {
            selected = std::min(static_cast<int>(rows.size()) - 1, selected + 25);
            return true;
        }

        if (e.is_mouse()) {
            auto m = e.mouse();
            if (m.button == Mouse::WheelUp) {
                selected = std::max(0, selected - 3);
                return true;
            }
            if (m.button == Mouse::WheelDown) {
                selected = std::min(static_cast<int>(rows.size()) - 1, selected + 3);
                return true;
            }
        }

        if (e == Event::ArrowRight) {
            if (r.is_dir) {
                expanded.insert(r.node->full_path);
                rows = rebuild();
            }
            return true;
        }
        if (e == Event::ArrowLeft) {
            if (r.is_dir) {
                expanded.erase(r.node->full_path);
                rows = rebuild();
            }
            return true;
        }
        if (e == Event::Return) {
            load_preview_for_selected();
            return true;
        }

        return false;
    });

    screen.Loop(app);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Args a;
    try {
        if (!parse_args(argc, argv, a)) {
            usage();
            return 2;
        }
    } catch (const std::exception& e) {
        // std::stoull on a bad number
        std::cerr << "Invalid argument: " << e.what() << "\n";
        usage();
        return 2;
    }

    Ansi ansi;
    ansi.enabled = !a.no_color && is_tty();

    ipld::ReadOptions ro;
    ro.compression = a.inflate ? ipld::CompressionMode::Always : ipld::CompressionMode::Auto;

    try {
        if (a.cmd == "info") {
            auto [block, info] = ipld::read_block_with_info(a.file, ro);

            std::cout << ansi.bold() << "File" << ansi.reset() << ": " << a.file << "\n";
            std::cout << ansi.bold() << "File size" << ansi.reset() << ": " << info.file_size << "\n";
            std::cout << ansi.bold() << "Compression" << ansi.reset() << ": " << (info.compressed ? "zlib" : "none") << "\n";
            std::cout << ansi.bold() << "Block size" << ansi.reset() << ": " << block.size() << " bytes\n";
            std::cout << ansi.bold() << "Block CRC" << ansi.reset() << ": " << hex8(info.crc32) << "\n";

            ipld::Value root = ipld::decode_as_value(block, ro.decode);
            std::cout << ansi.bold() << "Root" << ansi.reset() << ": "
                      << ansi.yellow() << ipld::to_string(root.kind()) << ansi.reset()
                      << " " << ansi.gray() << summary(root) << ansi.reset() << "\n";
            return 0;
        }

        ipld::Value root = ipld::read_value_file(a.file, ro);

        if (a.cmd == "diag") {
            std::cout << root << "\n";
            return 0;
        }

        if (a.cmd == "tree") {
            const ipld::Value* node = &root;
            if (!a.prefix.empty()) {
                node = find_path(root, a.prefix);
                if (!node) {
                    std::cerr << "prefix not found: " << a.prefix << "\n";
                    return 2;
                }
                std::cout << ansi.dim() << "prefix: " << a.prefix << ansi.reset() << "\n";
            }

            std::cout << ansi.bold() << "IPLD value tree" << ansi.reset() << ": " << a.file
                      << " " << ansi.gray() << summary(*node) << ansi.reset() << "\n";
            print_tree(*node, ansi, 0, 0, a.max_depth, a.max_elems);
            return 0;
        }

        if (a.cmd == "show") {
            return run_show(a, root, ansi);
        }

    } catch (const ipld::CborError& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << " (" << ipld::to_string(e.kind()) << "): " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << ansi.red() << "Error" << ansi.reset() << ": " << e.what() << "\n";
        return 1;
    }

    usage();
    return 2;
}
