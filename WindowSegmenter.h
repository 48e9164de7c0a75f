/**
 * Header file for the sliding window segmentation of text lines
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __WINDOWSEGMENTER_H__
#define __WINDOWSEGMENTER_H__

#include <stddef.h>
#include <vector>

/**
 * A window of consecutive lines: [start, start+size).
 */
struct LineWindow {
  size_t start;
  size_t size;
};

class WindowSegmenter {
  public:
    WindowSegmenter( int window_size = 2, int overlap = 0 );
    int getWindowSize() const { return windowSize; }
    int getOverlap() const { return overlap; }
    std::vector<LineWindow> segment( size_t num_lines ) const;
  private:
    int windowSize;
    int overlap;
};

#endif
