#include "render/TerminalRenderHost.hpp"
#include <ftxui/dom/elements.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <regex>
#include <sstream>

using namespace ftxui;

namespace {

std::string attribute(const std::string& tag, const std::string& name) {
    std::regex re("\\b" + name + "\\s*=\\s*(\"([^\"]*)\"|'([^']*)')",
                  std::regex::icase);
    std::smatch m;
    if (!std::regex_search(tag, m, re)) return "";
    return m[2].matched ? m[2].str() : m[3].str();
}

std::string decodeEntities(std::string s) {
    static const std::pair<const char*, const char*> entities[] = {
        {"&nbsp;", " "}, {"&lt;", "<"}, {"&gt;", ">"},
        {"&quot;", "\""}, {"&#39;", "'"}, {"&apos;", "'"},
        {"&amp;", "&"},   // last, so "&amp;lt;" stays "&lt;"
    };
    for (auto& [from, to] : entities) {
        std::string f(from);
        size_t pos = 0;
        while ((pos = s.find(f, pos)) != std::string::npos) {
            s.replace(pos, f.size(), to);
            pos += std::string(to).size();
        }
    }
    return s;
}

std::string collapseWhitespace(const std::string& s) {
    std::string out;
    bool space = false;
    for (char c : s) {
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            space = !out.empty();
            continue;
        }
        if (space) out += ' ';
        space = false;
        out += c;
    }
    return out;
}

Color levelColor(const std::string& level) {
    if (level == "error")   return Color::Red;
    if (level == "warning") return Color::Yellow;
    if (level == "success") return Color::Green;
    return Color::Cyan;
}

Color priorityColor(const std::string& priority) {
    if (priority == "critical") return Color::Red;
    if (priority == "high")     return Color::Yellow;
    if (priority == "low")      return Color::GrayDark;
    return Color::White;
}

} // namespace

TerminalRenderHost::TerminalRenderHost()
    : screen_(ScreenInteractive::Fullscreen())
{
}

TerminalRenderHost::~TerminalRenderHost() {
    stop();
}

// ── Lifecycle ────────────────────────────────────────────────────────────

bool TerminalRenderHost::start() {
    if (loop_) return true;
    component_ = buildComponent();
    loop_ = std::make_unique<Loop>(&screen_, component_);
    addLog("Terminal render host ready");
    return true;
}

void TerminalRenderHost::stop() {
    if (!loop_) return;
    panes_.clear();
    loop_.reset();     // restores the terminal
}

void TerminalRenderHost::processEvents(std::chrono::milliseconds) {
    if (!loop_) return;

    if (!toastText_.empty() && std::chrono::steady_clock::now() > toastUntil_) {
        toastText_.clear();
        redraw();
    }

    loop_->RunOnce();

    // Handlers may call back into the host; hand events over only after
    // ftxui has finished with this frame.
    while (!outbox_.empty()) {
        HostEvent e = std::move(outbox_.front());
        outbox_.pop_front();
        if (onEvent) onEvent(e);
    }

    if (loop_->HasQuitted() && onQuit) {
        auto quit = std::move(onQuit);
        quit();
    }
}

// ── Windows ──────────────────────────────────────────────────────────────

bool TerminalRenderHost::openWindow(const WindowSpec& spec, std::string& error) {
    if (!loop_) {
        error = "Terminal render host is not running - cannot show '" +
                spec.title + "'";
        return false;
    }
    if (findPane(spec.id)) {
        error = "Window " + std::to_string(spec.id) + " is already open";
        return false;
    }

    Pane pane;
    pane.spec  = spec;
    pane.outer = {spec.contentSize.width, spec.contentSize.height};

    if (spec.content.kind == ContentSource::Kind::RemoteLocator) {
        pane.view.lines = {"This window shows a web page:", spec.content.value,
                           "", "Open it in a browser, then press Enter when done."};
    } else {
        pane.view = reduceMarkup(spec.content.value);
    }
    pane.centered = spec.centerOnScreen;

    panes_.push_back(std::move(pane));
    addLog("Opened '" + spec.title + "'");
    redraw();
    return true;
}

void TerminalRenderHost::closeWindow(WindowId id) {
    auto it = std::find_if(panes_.begin(), panes_.end(),
                           [id](const Pane& p) { return p.spec.id == id; });
    if (it == panes_.end()) return;
    addLog("Closed '" + it->spec.title + "'");
    panes_.erase(it);
    redraw();
}

void TerminalRenderHost::requestMeasurement(WindowId id, int padding) {
    Pane* pane = findPane(id);
    if (!pane) return;

    HostEvent e{HostEvent::Type::ContentMeasured};
    e.window   = id;
    e.measured = measure(pane->view, padding);
    emit(std::move(e));
}

void TerminalRenderHost::resizeWindow(WindowId id, Size outer) {
    if (Pane* pane = findPane(id)) {
        pane->outer = outer;
        redraw();
    }
}

void TerminalRenderHost::centerWindow(WindowId id) {
    if (Pane* pane = findPane(id)) pane->centered = true;
}

ForegroundResult TerminalRenderHost::bringToFront(WindowId id) {
    auto it = std::find_if(panes_.begin(), panes_.end(),
                           [id](const Pane& p) { return p.spec.id == id; });
    if (it == panes_.end()) return ForegroundResult::Unsupported;

    // A modal pane already on top keeps focus
    if (!panes_.back().spec.modal || it + 1 == panes_.end()) {
        Pane p = std::move(*it);
        panes_.erase(it);
        panes_.push_back(std::move(p));
        redraw();
    }
    return ForegroundResult::Requested;
}

TerminalRenderHost::Pane* TerminalRenderHost::topPane() {
    return panes_.empty() ? nullptr : &panes_.back();
}

TerminalRenderHost::Pane* TerminalRenderHost::findPane(WindowId id) {
    for (auto& p : panes_)
        if (p.spec.id == id) return &p;
    return nullptr;
}

void TerminalRenderHost::submitTop() {
    Pane* pane = topPane();
    if (!pane) return;

    nlohmann::json data = nlohmann::json::object();
    for (auto& f : pane->view.fields) data[f.id] = f.value;
    if (data.empty()) data["acknowledged"] = true;

    HostEvent e{HostEvent::Type::WindowClosed};
    e.window       = pane->spec.id;
    e.userResponse = nlohmann::json{{"status", "success"}, {"data", data}};
    emit(std::move(e));

    addLog("Submitted '" + pane->spec.title + "'", "success");
    panes_.pop_back();
}

void TerminalRenderHost::dismissTop() {
    Pane* pane = topPane();
    if (!pane) return;

    HostEvent e{HostEvent::Type::WindowClosed};
    e.window = pane->spec.id;
    emit(std::move(e));

    addLog("Dismissed '" + pane->spec.title + "'");
    panes_.pop_back();
}

// ── Notifications and dashboard ──────────────────────────────────────────

void TerminalRenderHost::showToast(const std::string& text, const std::string& level) {
    toastText_  = text;
    toastLevel_ = level;
    toastUntil_ = std::chrono::steady_clock::now() + std::chrono::seconds(4);
    addLog(text, level);
    redraw();
}

void TerminalRenderHost::setDashboardVisible(bool visible) {
    dashboardVisible_ = visible;
    if (!visible && mode_ == Mode::Chat) mode_ = Mode::Windows;
    redraw();
}

void TerminalRenderHost::postDashboardMessage(const nlohmann::json& message) {
    dashboard_.push_back(message);
    if (dashboard_.size() > maxDashboard_)
        dashboard_.erase(dashboard_.begin());
    redraw();
}

void TerminalRenderHost::addLog(const std::string& text, const std::string& level) {
    logs_.push_back({text, level});
    if (logs_.size() > maxLogs_)
        logs_.erase(logs_.begin());
}

void TerminalRenderHost::emit(HostEvent event) {
    outbox_.push_back(std::move(event));
}

void TerminalRenderHost::redraw() {
    if (loop_) screen_.PostEvent(Event::Custom);
}

// ── Markup reduction ─────────────────────────────────────────────────────

TerminalRenderHost::MarkupView TerminalRenderHost::reduceMarkup(const std::string& html) {
    MarkupView view;
    const auto icase = std::regex::icase;

    // Fields first, from the raw markup
    std::regex labelRe("<label\\b([^>]*)>([\\s\\S]*?)</label>", icase);
    std::vector<std::pair<std::string, std::string>> labels;
    for (std::sregex_iterator it(html.begin(), html.end(), labelRe), end; it != end; ++it) {
        std::string forId = attribute((*it)[1].str(), "for");
        std::string text  = collapseWhitespace(decodeEntities(
            std::regex_replace((*it)[2].str(), std::regex("<[^>]+>"), "")));
        if (!forId.empty()) labels.emplace_back(forId, text);
    }

    std::regex fieldRe("<(input|textarea)\\b[^>]*>", icase);
    for (std::sregex_iterator it(html.begin(), html.end(), fieldRe), end; it != end; ++it) {
        std::string tag  = it->str();
        std::string type = attribute(tag, "type");
        std::transform(type.begin(), type.end(), type.begin(), ::tolower);
        if (type == "hidden" || type == "submit" || type == "button" ||
            type == "checkbox" || type == "radio")
            continue;

        InputField f;
        f.id = attribute(tag, "id");
        if (f.id.empty()) f.id = attribute(tag, "name");
        if (f.id.empty()) f.id = "field" + std::to_string(view.fields.size() + 1);
        f.value  = decodeEntities(attribute(tag, "value"));
        f.secret = type == "password";

        for (auto& [forId, text] : labels)
            if (forId == f.id) f.label = text;
        if (f.label.empty()) f.label = attribute(tag, "placeholder");
        if (f.label.empty()) f.label = f.id;

        view.fields.push_back(std::move(f));
    }

    // Text
    std::string s = html;
    s = std::regex_replace(s, std::regex("<!--[\\s\\S]*?-->"), "");
    s = std::regex_replace(s, std::regex("<(head|script|style)\\b[\\s\\S]*?</\\1>", icase), "");
    s = std::regex_replace(s, std::regex("<(input|textarea)\\b[^>]*>", icase), "");
    s = std::regex_replace(s, std::regex("</textarea>", icase), "");
    s = std::regex_replace(s, std::regex("<label\\b[^>]*>[\\s\\S]*?</label>", icase), "");
    s = std::regex_replace(s, std::regex("<button\\b[^>]*>([\\s\\S]*?)</button>", icase), " [$1] ");
    s = std::regex_replace(s, std::regex("<li\\b[^>]*>", icase), "\n- ");
    s = std::regex_replace(s, std::regex("<br\\s*/?>", icase), "\n");
    s = std::regex_replace(s,
        std::regex("</?(p|div|h[1-6]|tr|ul|ol|table|section|form|pre|body|html)\\b[^>]*>", icase),
        "\n");
    s = std::regex_replace(s, std::regex("<[^>]+>"), "");
    s = decodeEntities(s);

    std::istringstream in(s);
    std::string line;
    bool lastBlank = true;
    while (std::getline(in, line)) {
        line = collapseWhitespace(line);
        if (line.empty()) {
            if (!lastBlank) view.lines.push_back("");
            lastBlank = true;
            continue;
        }
        view.lines.push_back(line);
        lastBlank = false;
    }
    while (!view.lines.empty() && view.lines.back().empty())
        view.lines.pop_back();

    return view;
}

Size TerminalRenderHost::measure(const MarkupView& view, int padding) {
    size_t cols = 0;
    for (auto& l : view.lines) cols = std::max(cols, l.size());
    for (auto& f : view.fields)
        cols = std::max(cols, f.label.size() + 2 + std::max<size_t>(f.value.size(), 20));

    size_t rows = view.lines.size() + view.fields.size();
    return {static_cast<int>(cols) * cellWidthPx + padding,
            static_cast<int>(rows) * cellHeightPx + padding};
}

// ── Rendering ────────────────────────────────────────────────────────────

Element TerminalRenderHost::renderPane(const Pane& pane) const {
    Elements body;
    for (auto& l : pane.view.lines)
        body.push_back(l.empty() ? text(" ") : paragraph(l));

    for (size_t i = 0; i < pane.view.fields.size(); ++i) {
        auto& f = pane.view.fields[i];
        bool focused = i == pane.focus;
        std::string shown = f.secret ? std::string(f.value.size(), '*') : f.value;
        body.push_back(hbox({
            text(focused ? "> " : "  "),
            text(f.label + ": ") | bold,
            text(shown) | (focused ? inverted : dim),
            focused ? text("_") | blink : text(""),
        }));
    }

    int cols = std::max(20, pane.outer.width / cellWidthPx);
    int rows = std::max(3, pane.outer.height / cellHeightPx);

    auto title = hbox({
        text(" " + pane.spec.title + " ") | bold,
        filler(),
        text(pane.spec.modal ? "modal " : "") | dim,
        text(std::to_string(pane.outer.width) + "x" +
             std::to_string(pane.outer.height) + " ") | dim,
    });

    auto frame = window(title, vbox(body) | yframe) |
                 size(WIDTH, LESS_THAN, cols) | size(HEIGHT, LESS_THAN, rows);
    return pane.centered ? frame | center : frame;
}

Element TerminalRenderHost::renderDashboard() const {
    Elements items;
    size_t start = dashboard_.size() > 30 ? dashboard_.size() - 30 : 0;
    for (size_t i = start; i < dashboard_.size(); ++i) {
        auto& m = dashboard_[i];
        bool fromUser = m.value("direction", "") == "user_to_ai";
        std::string who = fromUser ? "you> " : "ai> ";
        auto line = paragraph(who + m.value("content", ""));
        items.push_back(fromUser ? line | color(Color::Yellow)
                                 : line | color(priorityColor(m.value("priority", "normal"))));
    }
    if (items.empty())
        items.push_back(text("  No messages") | dim);

    return vbox({
        text(" Messages") | bold |
            color(mode_ == Mode::Chat ? Color::Yellow : Color::White),
        separator(),
        vbox(items) | yframe | flex,
    }) | size(WIDTH, EQUAL, 40) | border;
}

Component TerminalRenderHost::buildComponent() {
    auto renderer = Renderer([this] {
        auto header = hbox({
            text(" uibridge ") | bold | color(Color::Cyan) | inverted,
            text(" "),
            toastText_.empty() ? text("")
                               : text(toastText_) | color(levelColor(toastLevel_)) | bold,
            filler(),
            text("Windows: " + std::to_string(panes_.size()) + " "),
        });

        Element main;
        if (panes_.empty())
            main = text("No open windows") | dim | center | flex;
        else
            main = renderPane(panes_.back()) | flex;

        Elements logElements;
        size_t logStart = logs_.size() > 8 ? logs_.size() - 8 : 0;
        for (size_t i = logStart; i < logs_.size(); ++i)
            logElements.push_back(text("  " + logs_[i].text) |
                                  color(levelColor(logs_[i].level)) | dim);

        Element left = vbox({
            main,
            separator(),
            text(" Activity") | bold,
            vbox(logElements),
        }) | flex | border;

        Element inputBar;
        if (mode_ == Mode::Chat) {
            inputBar = hbox({
                text(" > ") | bold | color(Color::Yellow),
                text(chatInput_),
                text("_") | blink,
                filler(),
                text("[Enter] send  [Esc] back ") | dim,
            }) | borderLight | color(Color::Yellow);
        } else if (!panes_.empty()) {
            inputBar = text(" [Tab] next field  [Enter] submit  [Esc] close ") |
                       dim | borderLight;
        } else {
            inputBar = text(" [/] message  [q] quit ") | dim | borderLight;
        }

        return vbox({
            header,
            separator(),
            dashboardVisible_ ? hbox({left, renderDashboard()}) | flex : left,
            inputBar,
        });
    });

    return CatchEvent(renderer, [this](Event event) { return handleKey(event); });
}

bool TerminalRenderHost::handleKey(const Event& event) {
    if (mode_ == Mode::Chat) {
        if (event == Event::Escape) {
            mode_ = Mode::Windows;
            return true;
        }
        if (event == Event::Return) {
            if (!chatInput_.empty()) {
                HostEvent e{HostEvent::Type::UserMessage};
                e.message = {{"content", chatInput_}, {"type", "response"}};
                postDashboardMessage({{"direction", "user_to_ai"},
                                      {"content", chatInput_}});
                emit(std::move(e));
                chatInput_.clear();
            }
            return true;
        }
        if (event == Event::Backspace) {
            if (!chatInput_.empty()) chatInput_.pop_back();
            return true;
        }
        if (event.is_character()) {
            chatInput_ += event.character();
            return true;
        }
        return false;
    }

    if (Pane* pane = topPane()) {
        auto& fields = pane->view.fields;
        if (event == Event::Escape) {
            dismissTop();
            return true;
        }
        if (event == Event::Return) {
            submitTop();
            return true;
        }
        if (fields.empty()) return false;

        if (event == Event::Tab || event == Event::ArrowDown) {
            pane->focus = (pane->focus + 1) % fields.size();
            return true;
        }
        if (event == Event::TabReverse || event == Event::ArrowUp) {
            pane->focus = (pane->focus + fields.size() - 1) % fields.size();
            return true;
        }
        auto& value = fields[pane->focus].value;
        if (event == Event::Backspace) {
            if (!value.empty()) value.pop_back();
            return true;
        }
        if (event.is_character()) {
            value += event.character();
            return true;
        }
        return false;
    }

    if (event == Event::Character('/')) {
        mode_ = Mode::Chat;
        chatInput_.clear();
        if (!dashboardVisible_) dashboardVisible_ = true;
        return true;
    }
    if (event == Event::Character('q')) {
        spdlog::info("Terminal: quit requested");
        screen_.Exit();
        return true;
    }
    return false;
}
