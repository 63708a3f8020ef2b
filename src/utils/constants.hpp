#pragma once

#define CRLF "\r\n"
#define HTTP_VERSION "HTTP/1.1"

// Bytes pulled from a backend per body chunk
#define DEFAULT_CHUNK_SIZE (256 * 1024)

// A Range header listing more specs than this is ignored (full response)
#define MAX_RANGE_SPECS 100

// Length of the random part of a multipart/byteranges boundary
#define BOUNDARY_LENGTH 13

#define DEFAULT_MEDIA_TYPE "application/octet-stream"

// 0 = DEBUG, 1 = INFO, 2 = ERROR
#ifndef LOG_LEVEL
#define LOG_LEVEL 1
#endif
