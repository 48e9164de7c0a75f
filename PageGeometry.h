/**
 * Header file for the polygon geometry and cropping functions
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGEGEOMETRY_H__
#define __PAGEGEOMETRY_H__

#include <vector>

#include <opencv2/core/core.hpp>

enum PAGEDS_CROP {
  PAGEDS_CROP_OK = 0,
  PAGEDS_CROP_EMPTY,
  PAGEDS_CROP_DEGENERATE,
  PAGEDS_CROP_NARROW
};

class PageGeometry {
  public:
    static const char* cropStatusNames[];
    static bool pointsLimits( const std::vector<cv::Point>& points, int& xmin, int& xmax, int& ymin, int& ymax );
    static void pointsBBox( const std::vector<std::vector<cv::Point> >& polys, std::vector<cv::Point>& bbox );
    static bool cropBox( const cv::Size& size, const std::vector<cv::Point>& coords, cv::Rect& box );
    static PAGEDS_CROP crop( const cv::Mat& image, const std::vector<cv::Point>& coords, bool mask, int min_width, cv::Mat& cropped );
    static void maskPolygon( cv::Mat& cropped, const std::vector<cv::Point>& coords, const cv::Point& offset );
};

#endif
