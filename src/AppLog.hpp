#ifndef _APPLOG_HPP_
#define _APPLOG_HPP_

// Copyright 2025 orthopteroid@gmail.com, MIT License

namespace AppLog
{

// Info is only emitted when verbose, ie. --debug
void SetVerbose(bool verbose);

void Info(const char* szComponent, const char* sz, ...) __attribute__((format(printf, 2, 3)));

void Warn(const char* szComponent, const char* sz, ...) __attribute__((format(printf, 2, 3)));

void Err(const char* szComponent, const char* sz, ...) __attribute__((format(printf, 2, 3)));

};

#endif // _APPLOG_HPP_
