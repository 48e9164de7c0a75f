/**
 * Header file for the loading of page images
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGEIMAGE_H__
#define __PAGEIMAGE_H__

#include <string>
#include <vector>

#include <opencv2/core/core.hpp>

#include "PageModel.h"
#include "PageSource.h"

enum PAGEDS_IMAGE {
  PAGEDS_IMAGE_OK = 0,
  PAGEDS_IMAGE_NOT_FOUND,
  PAGEDS_IMAGE_LOAD_FAILED
};

/**
 * Finds the image of a page in a source or at its URL and decodes it as an
 * 8-bit 3-channel image with the EXIF orientation applied.
 */
class ImageLoader {
  public:
    static const char* statusNames[];
    ImageLoader( PageSource* source, long timeout = 20 );
    virtual ~ImageLoader() {};
    PAGEDS_IMAGE load( const PageData& page, cv::Mat& image, std::string& origin, std::string& error );
    static std::vector<std::string> candidates( const PageData& page );
    static bool decodeImage( const std::string& bytes, cv::Mat& image );
    static int readExifOrientation( const std::string& bytes );
    static void applyOrientation( cv::Mat& image, int orientation );
  protected:
    virtual bool fetchUrl( const std::string& url, std::string& bytes, std::string& error );
  private:
    PageSource* source;
    long timeout;
};

#endif
