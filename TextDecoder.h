/**
 * Header file for the decoding of XML bytes of unknown encoding
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#ifndef __TEXTDECODER_H__
#define __TEXTDECODER_H__

#include <string>

class TextDecoder {
  public:
    static const char* fallbackEncodings[];
    static const int minConfidence = 70;
    static bool decode( const std::string& raw, const std::string& label, std::string& text );
    static bool isUtf8( const std::string& raw );
    static bool detect( const std::string& raw, std::string& encoding, int& confidence );
    static bool convert( const std::string& raw, const char* encoding, std::string& text );
};

#endif
