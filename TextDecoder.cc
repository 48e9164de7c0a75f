/**
 * Decoding of XML bytes into UTF-8 text using ICU converters and charset detection.
 *
 * @version $Version: 2025.10.17$
 * @copyright Copyright (c) 2016-present, Mauricio Villegas <mauricio_ville@yahoo.com>
 * @license MIT License
 */

#include "TextDecoder.h"

#include <stdio.h>
#include <limits>

#include <unicode/ucnv.h>
#include <unicode/ucsdet.h>
#include <unicode/unistr.h>

using namespace std;

const char* TextDecoder::fallbackEncodings[] = {
  "ISO-8859-1",
  "windows-1252",
  "ISO-8859-15"
};

/**
 * Converts bytes in a given encoding to UTF-8, failing on any invalid or unmapped byte sequence.
 *
 * @param raw       The bytes to convert.
 * @param encoding  ICU name or alias of the source encoding.
 * @param text      The UTF-8 result.
 * @return          True on success, otherwise false.
 */
bool TextDecoder::convert( const string& raw, const char* encoding, string& text ) {
  if( raw.size() > (size_t)numeric_limits<int32_t>::max() )
    return false;

  UErrorCode status = U_ZERO_ERROR;
  UConverter* conv = ucnv_open( encoding, &status );
  if( U_FAILURE(status) )
    return false;

  ucnv_setToUCallBack( conv, UCNV_TO_U_CALLBACK_STOP, NULL, NULL, NULL, &status );
  if( U_FAILURE(status) ) {
    ucnv_close(conv);
    return false;
  }

  icu::UnicodeString ustr( raw.data(), (int32_t)raw.size(), conv, status );
  ucnv_close(conv);
  if( U_FAILURE(status) )
    return false;

  text.clear();
  ustr.toUTF8String(text);
  return true;
}

/**
 * Checks whether the bytes are strictly valid UTF-8.
 */
bool TextDecoder::isUtf8( const string& raw ) {
  string dummy;
  return convert( raw, "UTF-8", dummy );
}

/**
 * Runs the ICU charset detector on the bytes.
 *
 * @param raw         The bytes to analyze.
 * @param encoding    Name of the best matching encoding.
 * @param confidence  Confidence of the match in the range 0-100.
 * @return            False if the detector did not produce a match.
 */
bool TextDecoder::detect( const string& raw, string& encoding, int& confidence ) {
  if( raw.size() > (size_t)numeric_limits<int32_t>::max() )
    return false;

  UErrorCode status = U_ZERO_ERROR;
  UCharsetDetector* csd = ucsdet_open( &status );
  if( U_FAILURE(status) )
    return false;

  bool found = false;
  ucsdet_setText( csd, raw.data(), (int32_t)raw.size(), &status );
  const UCharsetMatch* match = U_SUCCESS(status) ? ucsdet_detect( csd, &status ) : NULL;
  if( match != NULL && U_SUCCESS(status) ) {
    const char* name = ucsdet_getName( match, &status );
    int32_t conf = ucsdet_getConfidence( match, &status );
    if( U_SUCCESS(status) && name != NULL ) {
      encoding = name;
      confidence = conf;
      found = true;
    }
  }

  ucsdet_close(csd);
  return found;
}

/**
 * Decodes bytes of unknown encoding: strict UTF-8 first, then a detected
 * encoding if confident enough, then a fixed list of western encodings.
 *
 * @param raw    The bytes to decode.
 * @param label  Name used in diagnostics, e.g. the file path.
 * @param text   The decoded UTF-8 text.
 * @return       True on success, otherwise false.
 */
bool TextDecoder::decode( const string& raw, const string& label, string& text ) {
  if( isUtf8( raw ) ) {
    text = raw;
    return true;
  }

  string encoding;
  int confidence = 0;
  if( detect( raw, encoding, confidence ) &&
      confidence > minConfidence &&
      convert( raw, encoding.c_str(), text ) )
    return true;

  int encodings = sizeof(fallbackEncodings) / sizeof(fallbackEncodings[0]);
  for( int n=0; n<encodings; n++ )
    if( convert( raw, fallbackEncodings[n], text ) )
      return true;

  fprintf( stderr, "warning: could not decode %s with any supported encoding\n", label.c_str() );
  return false;
}
