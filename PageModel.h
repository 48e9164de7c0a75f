/**
 * Header file for the in-memory model of parsed Page XML documents
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGEMODEL_H__
#define __PAGEMODEL_H__

#include <stdio.h>
#include <string>
#include <vector>
#include <stdexcept>

#include <opencv2/core/core.hpp>

#define throw_runtime_error( fmt, ... ) { char buffer[1024]; snprintf( buffer, sizeof buffer, fmt, ##__VA_ARGS__ ); throw std::runtime_error(buffer); }

/**
 * A TextLine. The regionId is a copy of the owning region's id.
 */
struct PageLine {
  std::string id;
  bool hasText = false;
  std::string text;
  std::vector<cv::Point> coords;
  bool hasBaseline = false;
  std::vector<cv::Point> baseline;
  int readingOrder = 0;
  std::string regionId;
};

struct PageRegion {
  std::string id;
  std::string type = "paragraph";
  std::vector<cv::Point> coords;
  std::vector<PageLine> lines;
  int readingOrder = 0;
  bool hasText = false;
  std::string text;
};

struct PageData {
  std::string imageFilename;
  int imageWidth = 0;
  int imageHeight = 0;
  bool hasImageUrl = false;
  std::string imageUrl;
  std::vector<PageRegion> regions;
  std::string xml;
  std::string project;
};

#endif
