#pragma once

/* Entry points for CLI modes.
   Each function parses argv options and runs the selected mode.
   Return value: 0 on success, non-zero on error. */

/* Scroll through a synthetic page and stitch it.
   Example:
     scroll-stitch-cli simulate --doc-height=3000 --key=space --save=page.png */
int run_simulate(int argc, char** argv);

/* Stitch frames that were captured earlier (image folder or SSF1 recording).
   Example:
     scroll-stitch-cli play --folder=./frames --crop=0,80,1280,900 --save=out.png */
int run_play    (int argc, char** argv);
