/**
 * Loading of page images from sources and URLs.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "PageImage.h"

#include <stdio.h>
#include <string.h>

#include <curl/curl.h>
#include <opencv2/imgcodecs/imgcodecs.hpp>

using namespace std;

const char* ImageLoader::statusNames[] = {
  "ok",
  "no image found",
  "image load failed"
};

/**
 * ImageLoader constructor.
 *
 * @param source   Source where to look for the images, can be NULL.
 * @param timeout  Timeout in seconds for image downloads.
 */
ImageLoader::ImageLoader( PageSource* source, long timeout ) {
  this->source = source;
  this->timeout = timeout;
}

/**
 * Paths in the source where the image of a page can be.
 */
vector<string> ImageLoader::candidates( const PageData& page ) {
  vector<string> paths;
  paths.push_back( page.project+'/'+page.imageFilename );
  paths.push_back( page.project+"/images/"+page.imageFilename );
  paths.push_back( page.imageFilename );
  return paths;
}

/**
 * Loads the image of a page.
 *
 * @param page    The page.
 * @param image   The decoded image.
 * @param origin  Source path or URL of the image.
 * @param error   Description of the failure.
 * @return        PAGEDS_IMAGE_OK, PAGEDS_IMAGE_NOT_FOUND or PAGEDS_IMAGE_LOAD_FAILED.
 */
PAGEDS_IMAGE ImageLoader::load( const PageData& page, cv::Mat& image, string& origin, string& error ) {
  string bytes;
  error.clear();
  origin.clear();

  if( source != NULL && source->locate( candidates(page), page.imageFilename, origin ) ) {
    if( ! source->read( origin, bytes ) ) {
      error = "unable to read image file";
      return PAGEDS_IMAGE_LOAD_FAILED;
    }
  }
  else if( page.hasImageUrl ) {
    origin = page.imageUrl;
    if( ! fetchUrl( page.imageUrl, bytes, error ) ) {
      if( error == "timeout" )
        fprintf( stderr, "Image download of %s timed out\n", page.imageFilename.c_str() );
      else
        fprintf( stderr, "Image download from %s failed: %s\n", page.imageUrl.c_str(), error.c_str() );
      return PAGEDS_IMAGE_NOT_FOUND;
    }
  }
  else
    return PAGEDS_IMAGE_NOT_FOUND;

  if( ! decodeImage( bytes, image ) ) {
    error = "unable to decode image";
    fprintf( stderr, "warning: error loading image %s: %s\n", origin.c_str(), error.c_str() );
    return PAGEDS_IMAGE_LOAD_FAILED;
  }

  applyOrientation( image, readExifOrientation( bytes ) );

  return PAGEDS_IMAGE_OK;
}


////////////////
/// Decoding ///
////////////////

/**
 * Decodes image bytes into an 8-bit 3-channel image, ignoring the EXIF orientation.
 */
bool ImageLoader::decodeImage( const string& bytes, cv::Mat& image ) {
  if( bytes.empty() )
    return false;
  vector<uchar> buffer( bytes.begin(), bytes.end() );
  try {
    image = cv::imdecode( buffer, cv::IMREAD_COLOR | cv::IMREAD_IGNORE_ORIENTATION );
  }
  catch( const cv::Exception& e ) {
    fprintf( stderr, "warning: %s\n", e.what() );
    return false;
  }
  return ! image.empty();
}

static unsigned readUInt16( const unsigned char* p, bool le ) {
  return le ? p[0] | (p[1]<<8) : (p[0]<<8) | p[1];
}

static unsigned readUInt32( const unsigned char* p, bool le ) {
  return le ?
    p[0] | (p[1]<<8) | (p[2]<<16) | ((unsigned)p[3]<<24) :
    ((unsigned)p[0]<<24) | (p[1]<<16) | (p[2]<<8) | p[3];
}

/**
 * Reads the orientation tag (0x0112) from the first IFD of a TIFF structure.
 */
static int readTiffOrientation( const unsigned char* tiff, size_t size ) {
  if( size < 8 )
    return 1;
  bool le;
  if( tiff[0] == 'I' && tiff[1] == 'I' )
    le = true;
  else if( tiff[0] == 'M' && tiff[1] == 'M' )
    le = false;
  else
    return 1;
  if( readUInt16( tiff+2, le ) != 42 )
    return 1;

  size_t ifd = readUInt32( tiff+4, le );
  if( ifd+2 > size )
    return 1;
  unsigned entries = readUInt16( tiff+ifd, le );
  for( unsigned n=0; n<entries; n++ ) {
    size_t entry = ifd+2+12*n;
    if( entry+12 > size )
      break;
    if( readUInt16( tiff+entry, le ) == 0x0112 ) {
      unsigned type = readUInt16( tiff+entry+2, le );
      if( type == 3 )
        return readUInt16( tiff+entry+8, le );
      if( type == 4 )
        return readUInt32( tiff+entry+8, le );
      return 1;
    }
  }
  return 1;
}

/**
 * Gets the EXIF orientation of a JPEG or TIFF image.
 *
 * @param bytes  The encoded image.
 * @return       The orientation, 1 if not available.
 */
int ImageLoader::readExifOrientation( const string& bytes ) {
  const unsigned char* data = (const unsigned char*)bytes.data();
  size_t size = bytes.size();

  if( size >= 4 && ( ! memcmp( data, "II*\0", 4 ) || ! memcmp( data, "MM\0*", 4 ) ) )
    return readTiffOrientation( data, size );

  if( size < 4 || data[0] != 0xFF || data[1] != 0xD8 )
    return 1;

  size_t pos = 2;
  while( pos+4 <= size ) {
    if( data[pos] != 0xFF )
      return 1;
    unsigned char marker = data[pos+1];
    if( marker == 0xFF ) {
      pos++;
      continue;
    }
    if( marker == 0xD9 || marker == 0xDA )
      return 1;
    size_t length = readUInt16( data+pos+2, false );
    if( length < 2 || pos+2+length > size )
      return 1;
    if( marker == 0xE1 && length >= 8 && ! memcmp( data+pos+4, "Exif\0\0", 6 ) )
      return readTiffOrientation( data+pos+10, length-8 );
    pos += 2+length;
  }
  return 1;
}

/**
 * Rotates an image according to an EXIF orientation: 3 by 180°, 6 by 90°
 * clockwise and 8 by 90° counterclockwise. Other values are ignored.
 */
void ImageLoader::applyOrientation( cv::Mat& image, int orientation ) {
  cv::Mat rotated;
  switch( orientation ) {
    case 6:
      cv::transpose(image, rotated);
      cv::flip(rotated, rotated, 1); //transpose+flip(1)=CW
      break;
    case 3:
      cv::flip(image, rotated, -1); //flip(-1)=180
      break;
    case 8:
      cv::transpose(image, rotated);
      cv::flip(rotated, rotated, 0); //transpose+flip(0)=CCW
      break;
    default:
      return;
  }
  image = rotated;
}


/////////////////
/// Downloads ///
/////////////////

static size_t curlWrite( char* ptr, size_t size, size_t nmemb, void* userdata ) {
  ((string*)userdata)->append( ptr, size*nmemb );
  return size*nmemb;
}

/**
 * Downloads an image.
 *
 * @param url    The image URL.
 * @param bytes  The downloaded content.
 * @param error  "timeout" if the request timed out, otherwise the curl error.
 * @return       False if the download failed.
 */
bool ImageLoader::fetchUrl( const string& url, string& bytes, string& error ) {
  CURL* curl = curl_easy_init();
  if( curl == NULL ) {
    error = "unable to initialize curl";
    return false;
  }

  char errbuf[CURL_ERROR_SIZE];
  errbuf[0] = '\0';
  bytes.clear();
  curl_easy_setopt( curl, CURLOPT_URL, url.c_str() );
  curl_easy_setopt( curl, CURLOPT_TIMEOUT, timeout );
  curl_easy_setopt( curl, CURLOPT_FOLLOWLOCATION, 1L );
  curl_easy_setopt( curl, CURLOPT_FAILONERROR, 1L );
  curl_easy_setopt( curl, CURLOPT_NOSIGNAL, 1L );
  curl_easy_setopt( curl, CURLOPT_ERRORBUFFER, errbuf );
  curl_easy_setopt( curl, CURLOPT_WRITEFUNCTION, curlWrite );
  curl_easy_setopt( curl, CURLOPT_WRITEDATA, &bytes );

  CURLcode res = curl_easy_perform( curl );
  curl_easy_cleanup( curl );

  if( res == CURLE_OPERATION_TIMEDOUT ) {
    error = "timeout";
    return false;
  }
  if( res != CURLE_OK ) {
    error = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(res);
    return false;
  }
  return true;
}
