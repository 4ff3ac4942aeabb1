#include "modes.hpp"

#include <iostream>
#include <string>

/*
  CLI entry point.

  Modes:
    - simulate : scroll a synthetic page through a full capture session.
    - play     : stitch previously captured frames (folder or recording).
*/
static void print_usage() {
    std::cout
        << "Usage:\n"
        << "  scroll-stitch-cli simulate [--view-width=800] [--view-height=600] [--doc-height=2400]\n"
        << "                             [--pattern=page|noise|blank] [--color] [--seed=1]\n"
        << "                             [--record=frames.ssf] [session options]\n"
        << "  scroll-stitch-cli play     (--folder=DIR [--ext=png,jpg] [--gray] | --file=frames.ssf)\n"
        << "                             [--prefetch] [session options]\n"
        << "\n"
        << "Session options:\n"
        << "  --crop=x,y,w,h | --crop-preset=NAME   --overlap=125   --min-offset=1\n"
        << "  --stride=4   --dup-threshold=0.002   --max-diff=0.08\n"
        << "  --key=space|down|pagedown   --delay=SEC   --scroll-delay=MS\n"
        << "  --max-frames=N   --duration=SEC   --stall-limit=3\n"
        << "  --output=NAME   --format=png   --manifest=session.json   --quiet\n";
}

int main(int argc, char** argv)
{
    if (argc < 2) { print_usage(); return 0; }
    const std::string mode = argv[1];

    if      (mode == "simulate") return run_simulate(argc, argv);
    else if (mode == "play")     return run_play    (argc, argv);

    std::cout << "Unknown mode: " << mode << "\n";
    print_usage();
    return 1;
}
