#include "config.hpp"

#include <algorithm>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "domain/fetchable.hpp"

namespace {

    int usage() {
        std::cerr <<
            "usage: protect_ctl [--config <name>] <command>\n"
            "  cameras | liveviews | viewports                 csv listing\n"
            "  describe-cameras | describe-liveviews | describe-viewports\n"
            "  snapshot <camera-name> <file> [--hq]\n"
            "  set-view <viewport-name> <liveview-id>\n";
        return 2;
    }

    template <domain::Fetchable T>
    void print_descriptions(std::vector<T> resources) {
        std::sort(resources.begin(), resources.end());
        for (const auto &resource : resources) {
            std::cout << domain::Describe(resource) << std::endl;
        }
    }

    int run(service::ProtectService &protect, const std::vector<std::string> &args) {
        const auto &command = args.front();
        if (command == "cameras" && args.size() == 1) {
            std::cout << domain::ToCsv(protect.Cameras().get()) << std::endl;
        } else if (command == "liveviews" && args.size() == 1) {
            std::cout << domain::ToCsv(protect.Liveviews().get()) << std::endl;
        } else if (command == "viewports" && args.size() == 1) {
            std::cout << domain::ToCsv(protect.Viewports().get()) << std::endl;
        } else if (command == "describe-cameras" && args.size() == 1) {
            print_descriptions(protect.Cameras().get());
        } else if (command == "describe-liveviews" && args.size() == 1) {
            print_descriptions(protect.Liveviews().get());
        } else if (command == "describe-viewports" && args.size() == 1) {
            print_descriptions(protect.Viewports().get());
        } else if (command == "snapshot" && (args.size() == 3 || args.size() == 4)) {
            const bool high_quality = args.size() == 4 && args[3] == "--hq";
            if (args.size() == 4 && !high_quality) {
                return usage();
            }
            const auto image = protect.GetSnapshot(args[1], high_quality).get();
            std::ofstream out(args[2], std::ios::binary);
            if (!out) {
                std::cerr << "protect_ctl: cannot open " << args[2] << " for writing" << std::endl;
                return 1;
            }
            out.write(image.data(), static_cast<std::streamsize>(image.size()));
            std::cout << "wrote " << image.size() << " bytes to " << args[2] << std::endl;
        } else if (command == "set-view" && args.size() == 3) {
            const auto viewport_id = protect.LookupViewportId(args[1]).get();
            if (!viewport_id) {
                throw domain::NotFoundError("Viewport", args[1]);
            }
            protect.ChangeViewportView(*viewport_id, args[2]).get();
            const auto liveview_name = protect.LookupLiveviewName(args[2]).get();
            std::cout << args[1] << " now showing " << liveview_name.value_or(args[2]) << std::endl;
        } else {
            return usage();
        }
        return 0;
    }

}

int main(int argc, char *argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_name;
    if (args.size() >= 2 && args[0] == "--config") {
        config_name = args[1];
        args.erase(args.begin(), args.begin() + 2);
    }
    if (args.empty()) {
        return usage();
    }

    std::shared_ptr<service::ProtectService> protect;
    try {
        const auto config = application::to_client_config(application::get_json_config(config_name));
        protect = service::ProtectService::Create(config);
    } catch (const std::exception &e) {
        std::cerr << "protect_ctl: " << e.what() << std::endl;
        return 2;
    }

    protect->Start();
    int result = 1;
    try {
        result = run(*protect, args);
    } catch (const domain::ProtectError &e) {
        std::cerr << "protect_ctl: " << e.what() << std::endl;
    }
    protect->Stop();
    return result;
}
