/**
 * @file sfhost_replay_main.cpp
 * @brief sfhost-replay: feed a recorded message trace through one simulated slot.
 *
 * ## Usage
 *
 *     sfhost_replay [--config <path.json>] [--slot <id>] [--reject-resizes] [trace.jsonl]
 *
 * Reads the trace from the given file, or stdin when none is given. Each line is
 * one JSON object:
 *
 *     {"origin": "https://tpc.googlesyndication.com", "data": "<envelope JSON text>"}
 *     {"origin": "...", "data": {...}}          # object data is serialized first
 *     {"intersection": {"root": [t, r, b, l], "element": [t, r, b, l]}}
 *
 * The first form is dispatched to the router as a message event. The last form
 * updates the simulated slot's visibility and, once the channel is up, pushes a
 * geometry update.
 *
 * Every post the host makes to the creative frame is printed to stdout as
 *
 *     {"target": "<origin>", "data": <decoded JSON>}
 *
 * The simulated page settles resizes immediately: it applies them, unless
 * --reject-resizes is given, in which case it refuses them.
 */

#include "sfh_host.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace sfhost;
using namespace sfhost::safeframe;

namespace
{

// ---------------------------------------------------------------------------
// Simulated page
// ---------------------------------------------------------------------------

class PrintingFrameWindow : public FrameWindow
{
  public:
    void post_message(const std::string &data, const std::string &target_origin) override
    {
        nlohmann::json line{{"target", target_origin}};
        try
        {
            line["data"] = nlohmann::json::parse(data);
        }
        catch (const nlohmann::json::parse_error &)
        {
            line["data"] = data;
        }
        std::cout << line.dump() << "\n";
    }
};

class ReplayEventSource : public MessageEventSource
{
  public:
    void add_message_listener(MessageListener listener) override
    {
        m_listeners.push_back(std::move(listener));
    }

    void emit(const MessageEvent &event)
    {
        for (const auto &listener : m_listeners)
            listener(event);
    }

  private:
    std::vector<MessageListener> m_listeners;
};

class ReplayObserver : public VisibilityObserver
{
  public:
    explicit ReplayObserver(VisibilityCallback *&slot) : m_slot(slot) {}
    ~ReplayObserver() override { m_slot = nullptr; }

    void start(VisibilityCallback on_change) override
    {
        m_callback = std::move(on_change);
        m_slot = &m_callback;
    }

  private:
    VisibilityCallback *&m_slot;
    VisibilityCallback   m_callback;
};

class SimulatedSlot : public SlotElement
{
  public:
    explicit SimulatedSlot(bool reject_resizes) : m_reject(reject_resizes)
    {
        m_entry.root_bounds = Rect{0, 1024, 768, 0};
        m_entry.bounding_client_rect = Rect{100, 300, 150, 0};
    }

    FrameWindow *frame_window() override { return &m_window; }
    IntersectionEntry intersection_entry() const override { return m_entry; }
    std::string style_z_index() const override { return ""; }
    FrameSize current_size() const override { return m_size; }
    FrameSize initial_size() const override { return m_initial; }

    void set_frame_size(const FrameSize &size) override
    {
        LOGGER_INFO("replay: frame resized to {}x{}", size.width, size.height);
    }

    void attempt_change_size(std::optional<int> height, std::optional<int> width,
                             ResizeCallback done) override
    {
        if (m_reject)
        {
            done(ResizeOutcome::Rejected);
            return;
        }
        m_size.height = height.value_or(m_size.height);
        m_size.width = width.value_or(m_size.width);
        m_entry.bounding_client_rect.bottom = m_entry.bounding_client_rect.top + m_size.height;
        m_entry.bounding_client_rect.right = m_entry.bounding_client_rect.left + m_size.width;
        done(ResizeOutcome::Resolved);
    }

    void reset_pending_change_size() override {}

    void force_collapse() override
    {
        LOGGER_INFO("replay: slot force-collapsed");
        m_size = FrameSize{0, 0};
    }

    std::unique_ptr<VisibilityObserver> create_visibility_observer() override
    {
        return std::make_unique<ReplayObserver>(m_on_change);
    }

    std::optional<std::string> fluid_impression_url() const override { return std::nullopt; }
    void clear_fluid_impression_url() override {}
    void fire_delayed_impressions(const std::string &url) override
    {
        LOGGER_INFO("replay: impression fired for '{}'", url);
    }

    std::string host_origin() const override { return "https://publisher.example"; }
    std::string safeframe_version() const override { return "1-0-14"; }
    bool is_fluid() const override { return false; }

    void observe(const IntersectionEntry &entry)
    {
        m_entry = entry;
        if (m_on_change != nullptr)
            (*m_on_change)(entry);
    }

  private:
    bool                m_reject;
    PrintingFrameWindow m_window;
    IntersectionEntry   m_entry;
    FrameSize           m_initial{50, 300};
    FrameSize           m_size{50, 300};
    VisibilityCallback *m_on_change{nullptr};
};

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

struct ReplayArgs
{
    std::string config_path;
    std::string slot_id{"slot-1"};
    std::string trace_path;
    bool        reject_resizes{false};
};

void print_usage(const char *prog)
{
    std::cout << "Usage:\n"
              << "  " << prog
              << " [--config <path.json>] [--slot <id>] [--reject-resizes] [trace.jsonl]\n\n"
              << "Options:\n"
              << "  --config <path>    Host JSON config (defaults apply when omitted)\n"
              << "  --slot <id>        Slot identifier of the simulated slot (default slot-1)\n"
              << "  --reject-resizes   Make the simulated page refuse every resize\n"
              << "  --help             Show this message\n";
}

ReplayArgs parse_args(int argc, char *argv[])
{
    ReplayArgs args;
    for (int i = 1; i < argc; ++i)
    {
        std::string_view arg(argv[i]);
        if (arg == "--help" || arg == "-h")
        {
            print_usage(argv[0]);
            std::exit(0);
        }
        if (arg == "--config" && i + 1 < argc)
        {
            args.config_path = argv[++i];
        }
        else if (arg == "--slot" && i + 1 < argc)
        {
            args.slot_id = argv[++i];
        }
        else if (arg == "--reject-resizes")
        {
            args.reject_resizes = true;
        }
        else if (!arg.empty() && arg.front() != '-' && args.trace_path.empty())
        {
            args.trace_path = std::string(arg);
        }
        else
        {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            std::exit(1);
        }
    }
    return args;
}

Rect rect_from_json(const nlohmann::json &j)
{
    if (!j.is_array() || j.size() != 4)
        throw std::runtime_error("rectangle must be [top, right, bottom, left]");
    return Rect{j[0].get<double>(), j[1].get<double>(), j[2].get<double>(), j[3].get<double>()};
}

void replay_line(const std::string &line, MessageRouter &router, SimulatedSlot &slot)
{
    const auto j = nlohmann::json::parse(line);
    if (j.contains("intersection"))
    {
        const auto &in = j.at("intersection");
        slot.observe(IntersectionEntry{rect_from_json(in.at("root")),
                                       rect_from_json(in.at("element"))});
        return;
    }
    MessageEvent event;
    event.origin = j.value("origin", std::string{});
    const auto &data = j.at("data");
    event.data = data.is_string() ? data.get<std::string>() : data.dump();
    router.dispatch(event);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------

int main(int argc, char *argv[])
{
    const ReplayArgs args = parse_args(argc, argv);

    // ── Load config ───────────────────────────────────────────────────────────
    HostConfig config;
    try
    {
        if (!args.config_path.empty())
            config = HostConfig::from_json_file(args.config_path);
        config.apply_env_overrides();
        config.apply_logging();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return 1;
    }

    // ── Trace input ───────────────────────────────────────────────────────────
    std::ifstream file;
    if (!args.trace_path.empty())
    {
        file.open(args.trace_path);
        if (!file.is_open())
        {
            std::cerr << "Cannot open trace '" << args.trace_path << "'\n";
            return 1;
        }
    }
    std::istream &in = args.trace_path.empty() ? std::cin : file;

    // ── Page objects ──────────────────────────────────────────────────────────
    ReplayEventSource      events;
    SessionRegistry        registry;
    MessageRouter          router(events, registry, config.trusted_origin);
    SimulatedSlot          slot(args.reject_resizes);
    uid::RandomTokenSource tokens;
    HostSession            session(args.slot_id, slot, registry, tokens, config);

    std::cout << nlohmann::json{{"name", session.name_attributes()}}.dump() << "\n";

    int         line_no = 0;
    std::string line;
    while (std::getline(in, line))
    {
        ++line_no;
        if (line.empty() || line.front() == '#')
            continue;
        try
        {
            replay_line(line, router, slot);
        }
        catch (const nlohmann::json::exception &e)
        {
            std::cerr << "line " << line_no << ": bad trace entry: " << e.what() << "\n";
            return 1;
        }
        catch (const std::runtime_error &e)
        {
            std::cerr << "line " << line_no << ": " << e.what() << "\n";
            return 1;
        }
        catch (const FrameUnavailableError &e)
        {
            std::cerr << "line " << line_no << ": " << e.what() << "\n";
            return 1;
        }
    }

    const RouterStats stats = router.stats();
    LOGGER_INFO("replay: {} line(s), {} dispatched, dropped: {} origin, {} malformed, "
                "{} unknown slot",
                line_no, stats.dispatched, stats.dropped_origin, stats.dropped_malformed,
                stats.dropped_unknown_slot);
    utils::Logger::instance().flush();
    return 0;
}
