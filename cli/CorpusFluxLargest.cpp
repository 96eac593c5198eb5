#include <iostream>

#include "corpusflux/config.hpp"
#include "corpusflux/stages.hpp"

int main(int argc, char **argv)
{
    std::ios::sync_with_stdio(false);
    std::cin.tie(nullptr);

    using namespace corpusflux;

    Config cfg;
    std::string err;
    bool show_help = false;
    if (!load_stage_config(argc, argv, StageKind::select, cfg, err, show_help))
    {
        if (show_help)
        {
            print_usage(StageKind::select);
            return 0;
        }
        std::cerr << err << "\n";
        print_usage(StageKind::select);
        return 1;
    }

    SelectReport report;
    if (!run_select(cfg, report, err))
    {
        std::cerr << err << "\n";
        return 1;
    }
    return report.failed_files.empty() ? 0 : 1;
}
