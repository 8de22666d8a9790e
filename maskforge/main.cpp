//////////////////////////////////////////////////////////////////////
// maskforge: bitmap, Gerber and GDSII sources to exposure panel PNGs

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#include <getopt.h>

#include <fmt/ranges.h>

#include "maskforge_lib.h"
#include "job_pool.h"
#include "preview_debouncer.h"
#include "settings.h"
#include "util.h"

LOG_CONTEXT("main", info);

using namespace maskforge_lib;

//////////////////////////////////////////////////////////////////////

namespace
{
    enum option_id
    {
        opt_display_px = 256,
        opt_display_mm,
        opt_pcb_mm,
        opt_diameter,
        opt_offset,
        opt_invert,
        opt_mirror,
        opt_no_mirror,
        opt_cell,
        opt_layer,
        opt_overflow,
        opt_live,
        opt_no_settings
    };

    option const long_options[] = {
        { "output", required_argument, nullptr, 'o' },         { "display-px", required_argument, nullptr, opt_display_px },
        { "display-mm", required_argument, nullptr, opt_display_mm }, { "pcb-mm", required_argument, nullptr, opt_pcb_mm },
        { "diameter", required_argument, nullptr, opt_diameter }, { "offset", required_argument, nullptr, opt_offset },
        { "threshold", required_argument, nullptr, 't' },      { "invert", no_argument, nullptr, opt_invert },
        { "mirror", no_argument, nullptr, opt_mirror },        { "no-mirror", no_argument, nullptr, opt_no_mirror },
        { "cell", required_argument, nullptr, opt_cell },      { "layer", required_argument, nullptr, opt_layer },
        { "overflow", required_argument, nullptr, opt_overflow }, { "live", no_argument, nullptr, opt_live },
        { "no-settings", no_argument, nullptr, opt_no_settings }, { "verbose", no_argument, nullptr, 'v' },
        { "help", no_argument, nullptr, 'h' },                 { nullptr, 0, nullptr, 0 }
    };

    //////////////////////////////////////////////////////////////////////

    struct command_line
    {
        std::string command;
        std::vector<std::filesystem::path> inputs;
        std::filesystem::path output;
        bool live{ false };
        bool use_settings{ true };
        int verbosity{ 0 };
    };

    //////////////////////////////////////////////////////////////////////

    void usage()
    {
        fmt::print("Usage: maskforge [options] bitmap|gerber|gds|gds-info <input>...\n"
                   "\n"
                   "  -o, --output FILE       output PNG (one input only, default <input>.png)\n"
                   "      --display-px WxH    display size in pixels\n"
                   "      --display-mm WxH    display size in mm\n"
                   "      --pcb-mm WxH        board size in mm (gerber)\n"
                   "      --diameter MM       circle diameter (bitmap, gds)\n"
                   "      --offset MM         circle centre distance from the display edge\n"
                   "  -t, --threshold N       0..254 (bitmap)\n"
                   "      --invert            invert the board (gerber)\n"
                   "      --mirror            mirror the board (gerber, default)\n"
                   "      --no-mirror         don't mirror the board\n"
                   "      --cell NAME         cell to render (gds, default the top cell)\n"
                   "      --layer N           layer to render (gds, default the lowest)\n"
                   "      --overflow MODE     clip or error, when a layer overhangs the board\n"
                   "      --live              read thresholds from stdin and re-render (bitmap)\n"
                   "      --no-settings       don't load or save settings\n"
                   "  -v, --verbose           more logging, twice for debug\n"
                   "  -h, --help              this\n");
    }

    //////////////////////////////////////////////////////////////////////

    bool parse_double(char const *text, double *value)
    {
        char *end;
        double d = strtod(text, &end);
        if(end == text || *end != '\0') {
            return false;
        }
        *value = d;
        return true;
    }


    //////////////////////////////////////////////////////////////////////
    // settings first so the options can override them

    bool parse_command_line(int argc, char **argv, command_line &cmd, settings_t &settings)
    {
        for(int i = 1; i < argc; ++i) {
            if(strcmp(argv[i], "--no-settings") == 0) {
                cmd.use_settings = false;
            }
        }
        if(cmd.use_settings) {
            settings.load();
        }

        int c;
        while((c = getopt_long(argc, argv, "o:t:vh", long_options, nullptr)) != -1) {

            double w;
            double h;

            switch(c) {

            case 'o':
                cmd.output = optarg;
                break;

            case opt_display_px:
                if(!parse_pixel_dimensions(optarg, &settings.display_pixel_width, &settings.display_pixel_height)) {
                    LOG_ERROR("Bad --display-px {}, expected WxH in whole pixels", optarg);
                    return false;
                }
                break;

            case opt_display_mm:
                if(!parse_dimensions(optarg, &w, &h)) {
                    LOG_ERROR("Bad --display-mm {}, expected WxH", optarg);
                    return false;
                }
                settings.display_width_mm = w;
                settings.display_height_mm = h;
                break;

            case opt_pcb_mm:
                if(!parse_dimensions(optarg, &w, &h)) {
                    LOG_ERROR("Bad --pcb-mm {}, expected WxH", optarg);
                    return false;
                }
                settings.pcb_width_mm = w;
                settings.pcb_height_mm = h;
                break;

            case opt_diameter:
                if(!parse_double(optarg, &settings.circle_diameter_mm)) {
                    LOG_ERROR("Bad --diameter {}", optarg);
                    return false;
                }
                break;

            case opt_offset:
                if(!parse_double(optarg, &settings.circle_offset_mm)) {
                    LOG_ERROR("Bad --offset {}", optarg);
                    return false;
                }
                break;

            case 't':
                if(!parse_int(optarg, &settings.threshold)) {
                    LOG_ERROR("Bad --threshold {}", optarg);
                    return false;
                }
                break;

            case opt_invert:
                settings.gerber_invert = true;
                break;

            case opt_mirror:
                settings.gerber_mirror = true;
                break;

            case opt_no_mirror:
                settings.gerber_mirror = false;
                break;

            case opt_cell:
                settings.gds_cell = optarg;
                break;

            case opt_layer:
                if(!parse_int(optarg, &settings.gds_layer)) {
                    LOG_ERROR("Bad --layer {}", optarg);
                    return false;
                }
                break;

            case opt_overflow:
                settings.overflow = optarg;
                break;

            case opt_live:
                cmd.live = true;
                break;

            case opt_no_settings:
                break;

            case 'v':
                cmd.verbosity += 1;
                break;

            case 'h':
                usage();
                exit(0);

            default:
                usage();
                return false;
            }
        }

        if(optind >= argc) {
            usage();
            return false;
        }
        cmd.command = argv[optind++];
        for(; optind < argc; ++optind) {
            cmd.inputs.emplace_back(argv[optind]);
        }
        if(cmd.inputs.empty()) {
            LOG_ERROR("No input files");
            return false;
        }
        if(!cmd.output.empty() && cmd.inputs.size() > 1) {
            LOG_ERROR("--output needs exactly one input");
            return false;
        }
        return true;
    }

    //////////////////////////////////////////////////////////////////////

    bool make_request(command_line const &cmd, settings_t const &settings, std::filesystem::path const &input, render_request &request)
    {
        request.display = display_geometry{}.with_pixels(settings.display_pixel_width, settings.display_pixel_height)
                              .with_physical(settings.display_width_mm, settings.display_height_mm);
        request.circles.diameter_mm = settings.circle_diameter_mm;
        request.circles.offset_from_edge_mm = settings.circle_offset_mm;

        if(cmd.command == "bitmap") {
            request.source = bitmap_request{ input, settings.threshold };
            return true;
        }

        if(cmd.command == "gerber") {
            gerber_request g;
            g.input = input;
            g.pcb.pcb_width_mm = settings.pcb_width_mm;
            g.pcb.pcb_height_mm = settings.pcb_height_mm;
            if(!overflow_policy_from_name(settings.overflow, &g.pcb.overflow)) {
                LOG_ERROR("Unknown overflow policy {}, use clip or error", settings.overflow);
                return false;
            }
            g.mirror = settings.gerber_mirror;
            g.invert = settings.gerber_invert;
            request.source = g;
            return true;
        }

        if(cmd.command == "gds") {
            gds_request g;
            g.input = input;
            g.cell = settings.gds_cell;
            if(settings.gds_layer >= 0) {
                g.layer = settings.gds_layer;
            }
            request.source = g;
            return true;
        }

        LOG_ERROR("Unknown command {}", cmd.command);
        return false;
    }

    //////////////////////////////////////////////////////////////////////

    std::filesystem::path output_for(command_line const &cmd, std::filesystem::path const &input)
    {
        if(!cmd.output.empty()) {
            return cmd.output;
        }
        return suggest_output_filename(input);
    }

    //////////////////////////////////////////////////////////////////////

    bool write_result(render_request const &request, render_result const &result, std::filesystem::path const &output)
    {
        if(!result.ok()) {
            LOG_ERROR("{}", result.error);
            return false;
        }
        maskforge_error_code error = save_png(output, result.canvas);
        if(error != ok) {
            LOG_ERROR("Can't write {}: {}", output.string(), get_error_text(error));
            return false;
        }
        LOG_INFO("{} -> {}", request.input().string(), output.string());
        return true;
    }

    //////////////////////////////////////////////////////////////////////

    int gds_info(command_line const &cmd)
    {
        int failures = 0;
        for(auto const &input : cmd.inputs) {
            gds_library library;
            maskforge_error_code error = library.load(input);
            if(error != ok) {
                LOG_ERROR("{}: {}", input.string(), get_error_text(error));
                failures += 1;
                continue;
            }
            fmt::print("{}: library {}, {} um per database unit\n", input.string(), library.name, library.um_per_db());
            fmt::print("  cells: {}\n", fmt::join(library.list_cells(), ", "));
            fmt::print("  top cells: {}\n", fmt::join(library.top_cells(), ", "));
            fmt::print("  layers: {}\n", fmt::join(library.list_layers(), ", "));
        }
        return failures == 0 ? 0 : 1;
    }

    //////////////////////////////////////////////////////////////////////
    // one threshold per line on stdin, the newest one wins

    int live_preview(command_line const &cmd, settings_t &settings, job_pool &pool)
    {
        if(cmd.command != "bitmap" || cmd.inputs.size() != 1) {
            LOG_ERROR("--live needs the bitmap command and one input");
            return 1;
        }

        std::filesystem::path output = output_for(cmd, cmd.inputs[0]);
        std::mutex output_mutex;
        bool any_failed = false;

        preview_debouncer debouncer(pool, [&](render_request const &request, render_result const &result) {
            std::lock_guard lock(output_mutex);
            if(!write_result(request, result, output)) {
                any_failed = true;
            }
        });

        render_request request;
        if(!make_request(cmd, settings, cmd.inputs[0], request)) {
            return 1;
        }
        debouncer.post(request);

        std::string line;
        while(std::getline(std::cin, line)) {
            int threshold;
            if(!parse_int(line, &threshold)) {
                LOG_WARNING("Ignoring '{}', expected a threshold", line);
                continue;
            }
            settings.threshold = threshold;
            if(!make_request(cmd, settings, cmd.inputs[0], request)) {
                return 1;
            }
            debouncer.post(request);
        }
        debouncer.wait_idle();
        return any_failed ? 1 : 0;
    }

    //////////////////////////////////////////////////////////////////////
    // every input at once, results in the order given

    int render_all(command_line const &cmd, settings_t const &settings, job_pool &pool)
    {
        struct pending
        {
            render_request request;
            std::filesystem::path output;
            std::future<render_result> result;
        };

        std::vector<pending> jobs;
        for(auto const &input : cmd.inputs) {
            pending &p = jobs.emplace_back();
            if(!make_request(cmd, settings, input, p.request)) {
                return 1;
            }
            p.output = output_for(cmd, input);
        }

        for(auto &p : jobs) {
            p.result = pool.submit(p.request);
        }

        int failures = 0;
        for(auto &p : jobs) {
            render_result result = p.result.get();
            if(!write_result(p.request, result, p.output)) {
                failures += 1;
            }
        }
        if(failures != 0) {
            LOG_ERROR("{} of {} failed", failures, jobs.size());
        }
        return failures == 0 ? 0 : 1;
    }

}    // namespace

//////////////////////////////////////////////////////////////////////

int flushed_puts(char const *s)
{
    int x = fputs(s, stderr);
    fputc('\n', stderr);
    fflush(stderr);
    return x;
}

//////////////////////////////////////////////////////////////////////

int main(int argc, char **argv)
{
    log_set_emitter_function(flushed_puts);

    command_line cmd;
    settings_t settings;

    if(!parse_command_line(argc, argv, cmd, settings)) {
        return 1;
    }

    switch(cmd.verbosity) {
    case 0:
        log_set_level(log_level_info);
        break;
    case 1:
        log_set_level(log_level_verbose);
        break;
    default:
        log_set_level(log_level_debug);
        break;
    }

    if(cmd.command == "gds-info") {
        return gds_info(cmd);
    }

    job_pool pool;
    pool.start(cmd.live ? 1 : std::min(job_pool::default_thread_count(), cmd.inputs.size()));

    int rc = cmd.live ? live_preview(cmd, settings, pool) : render_all(cmd, settings, pool);

    pool.stop();

    if(rc == 0 && cmd.use_settings) {
        settings.save();
    }
    return rc;
}
