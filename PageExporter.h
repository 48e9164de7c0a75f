/**
 * Header file for the PageExporter class
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __PAGEEXPORTER_H__
#define __PAGEEXPORTER_H__

#include <stdio.h>
#include <string>
#include <vector>
#include <utility>

#include <opencv2/core/core.hpp>

#include "PageModel.h"
#include "PageImage.h"
#include "WindowSegmenter.h"

enum PAGEDS_EXPORT_MODE {
  PAGEDS_EXPORT_RAW = 0,
  PAGEDS_EXPORT_TEXT,
  PAGEDS_EXPORT_REGION,
  PAGEDS_EXPORT_LINE,
  PAGEDS_EXPORT_WINDOW
};

struct ExportConfig {
  PAGEDS_EXPORT_MODE mode = PAGEDS_EXPORT_TEXT;
  int windowSize = 2;
  int overlap = 0;
  bool mask = false;
  int minWidth = 0;
  bool allowEmpty = false;
};

struct RecordField {
  std::string name;
  std::string value;
  bool null = false;
};

/**
 * One dataset row: an image and its named fields in column order.
 */
struct DatasetRecord {
  cv::Mat image;
  std::vector<RecordField> fields;
  void clear();
  void set( const char* name, const std::string& value );
  void set( const char* name, int value );
  void setNull( const char* name );
  const RecordField* get( const std::string& name ) const;
};

class PageExporter {
  public:
    static const char* modeNames[];
    static int parseMode( const char* mode );
    static std::vector<std::string> columns( PAGEDS_EXPORT_MODE mode );
    PageExporter( const std::vector<PageData>& pages, ImageLoader& loader, const ExportConfig& config );
    bool next( DatasetRecord& record );
    PAGEDS_EXPORT_MODE getMode() const { return config.mode; }
    int getProcessed() const { return processed; }
    int getSkipped() const { return skipped; }
    const std::vector<std::pair<std::string,std::string> >& getFailedImages() const { return failedImages; }
    void printSummary( FILE* file = stdout ) const;
  private:
    const std::vector<PageData>& pages;
    ImageLoader& loader;
    ExportConfig config;
    WindowSegmenter segmenter;
    size_t pagenum = 0;
    size_t regnum = 0;
    size_t linenum = 0;
    size_t winnum = 0;
    bool pageReady = false;
    cv::Mat image;
    std::vector<LineWindow> windows;
    int processed = 0;
    int skipped = 0;
    std::vector<std::pair<std::string,std::string> > failedImages;
    bool loadPage();
    void finishPage();
    bool cropElement( const std::vector<cv::Point>& coords, int min_width, const std::string& id, cv::Mat& cropped );
    bool nextPage( DatasetRecord& record );
    bool nextRegion( DatasetRecord& record );
    bool nextLine( DatasetRecord& record );
    bool nextWindow( DatasetRecord& record );
};

#endif
