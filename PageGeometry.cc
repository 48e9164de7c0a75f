/**
 * Polygon geometry and cropping functions for Page XML coordinates.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "PageGeometry.h"

#include <algorithm>

#include <opencv2/imgproc/imgproc.hpp>

using namespace std;

const char* PageGeometry::cropStatusNames[] = {
  "ok",
  "no coordinates",
  "invalid crop coordinates",
  "narrower than minimum width"
};

/**
 * Gets the minimum and maximum coordinate values for an array of points.
 *
 * @param points     The vector of points to find the limits.
 * @param xmin       Minimum x value.
 * @param xmax       Maximum x value.
 * @param ymin       Minimum y value.
 * @param ymax       Maximum y value.
 * @return           False if there are no points, otherwise true.
 */
bool PageGeometry::pointsLimits( const vector<cv::Point>& points, int& xmin, int& xmax, int& ymin, int& ymax ) {
  if( points.size() == 0 )
    return false;

  xmin = xmax = points[0].x;
  ymin = ymax = points[0].y;

  for( auto&& point : points ) {
    if( xmin > point.x ) xmin = point.x;
    if( xmax < point.x ) xmax = point.x;
    if( ymin > point.y ) ymin = point.y;
    if( ymax < point.y ) ymax = point.y;
  }

  return true;
}

/**
 * Generates the 4 points of the bounding box that covers all given polygons,
 * clockwise starting at the top-left corner.
 *
 * @param polys      The polygons to find the limits.
 * @param bbox       The 4 points defining the bounding box, empty if no points.
 */
void PageGeometry::pointsBBox( const vector<vector<cv::Point> >& polys, vector<cv::Point>& bbox ) {
  bbox.clear();

  vector<cv::Point> points;
  for( auto&& poly : polys )
    points.insert( points.end(), poly.begin(), poly.end() );

  int xmin, xmax, ymin, ymax;
  if( ! pointsLimits( points, xmin, xmax, ymin, ymax ) )
    return;

  bbox.push_back( cv::Point(xmin,ymin) );
  bbox.push_back( cv::Point(xmax,ymin) );
  bbox.push_back( cv::Point(xmax,ymax) );
  bbox.push_back( cv::Point(xmin,ymax) );
}

/**
 * Computes the crop window of a polygon clamped to the image bounds.
 *
 * @param size    Size of the image.
 * @param coords  Polygon points.
 * @param box     The crop window, right and bottom limits exclusive.
 * @return        False if the polygon is empty or the window is degenerate.
 */
bool PageGeometry::cropBox( const cv::Size& size, const vector<cv::Point>& coords, cv::Rect& box ) {
  int xmin, xmax, ymin, ymax;
  if( ! pointsLimits( coords, xmin, xmax, ymin, ymax ) )
    return false;

  xmin = max( 0, xmin );
  ymin = max( 0, ymin );
  xmax = min( size.width, xmax );
  ymax = min( size.height, ymax );

  if( xmin >= xmax || ymin >= ymax )
    return false;

  box = cv::Rect( xmin, ymin, xmax-xmin, ymax-ymin );
  return true;
}

/**
 * Crops the bounding box of a polygon, optionally setting to white the pixels outside of the polygon.
 *
 * @param image      Source image.
 * @param coords     Polygon points in image coordinates.
 * @param mask       Whether to whiten the area outside the polygon.
 * @param min_width  Minimum crop width, zero or negative for no minimum.
 * @param cropped    The cropped image, a copy independent of the source.
 * @return           PAGEDS_CROP_OK on success, otherwise the reason for failing.
 */
PAGEDS_CROP PageGeometry::crop( const cv::Mat& image, const vector<cv::Point>& coords, bool mask, int min_width, cv::Mat& cropped ) {
  cropped.release();
  if( coords.size() == 0 )
    return PAGEDS_CROP_EMPTY;

  cv::Rect box;
  if( ! cropBox( image.size(), coords, box ) )
    return PAGEDS_CROP_DEGENERATE;

  if( min_width > 0 && box.width < min_width )
    return PAGEDS_CROP_NARROW;

  cropped = image(box).clone();

  if( mask )
    maskPolygon( cropped, coords, box.tl() );

  return PAGEDS_CROP_OK;
}

/**
 * Sets to white all pixels of a crop that fall outside of a polygon.
 *
 * @param cropped  The cropped image, modified in place.
 * @param coords   Polygon points in source image coordinates.
 * @param offset   Top-left corner of the crop in the source image.
 */
void PageGeometry::maskPolygon( cv::Mat& cropped, const vector<cv::Point>& coords, const cv::Point& offset ) {
  /// Subtract crop window offset ///
  vector<vector<cv::Point> > polys(1);
  for( auto&& coord : coords )
    polys[0].push_back( coord - offset );

  /// Hard mask, no anti-aliasing ///
  cv::Mat wmask = cv::Mat::zeros( cropped.size(), CV_8UC1 );
  cv::fillPoly( wmask, polys, cv::Scalar(255), cv::LINE_8 );

  cv::Mat white( cropped.size(), cropped.type(), cv::Scalar::all(255) );
  cropped.copyTo( white, wmask );
  cropped = white;
}
