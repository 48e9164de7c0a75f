/**
 * Sliding window segmentation of the reading ordered lines of a region.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "WindowSegmenter.h"

#include <string>
#include <stdexcept>

using namespace std;

/**
 * WindowSegmenter constructor.
 *
 * @param window_size  Number of lines per window, at least 1.
 * @param overlap      Number of lines shared by consecutive windows, less than window_size.
 */
WindowSegmenter::WindowSegmenter( int window_size, int overlap ) {
  if( window_size < 1 )
    throw invalid_argument( string("WindowSegmenter: window size must be at least 1, got ") + to_string(window_size) );
  if( overlap < 0 )
    throw invalid_argument( string("WindowSegmenter: overlap cannot be negative, got ") + to_string(overlap) );
  if( overlap >= window_size )
    throw invalid_argument( "WindowSegmenter: overlap must be less than window size" );
  this->windowSize = window_size;
  this->overlap = overlap;
}

/**
 * Splits a sequence of lines into windows. The last window is the first one
 * that reaches the end, so it can have less than window size lines.
 *
 * @param num_lines  Number of lines in the sequence.
 * @return           The windows in order.
 */
vector<LineWindow> WindowSegmenter::segment( size_t num_lines ) const {
  vector<LineWindow> windows;
  size_t step = windowSize - overlap;

  for( size_t start=0; start<num_lines; start+=step ) {
    LineWindow window;
    window.start = start;
    window.size = num_lines-start < (size_t)windowSize ? num_lines-start : windowSize;
    windows.push_back( window );
    if( start+windowSize >= num_lines )
      break;
  }

  return windows;
}
