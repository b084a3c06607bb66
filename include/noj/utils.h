#ifndef INCLUDE_NOJ_UTILS_H_
#define INCLUDE_NOJ_UTILS_H_

#include <string>
#include <cstdint>
#include <functional>

#include "submission.h"

// Source of the current UNIX time in seconds; injectable for testing.
using Clock = std::function<int64_t()>;
int64_t UnixTimestamp();

const char* StatusToDesc(Status);
const char* StatusToAbr(Status);
// returns Status::UNRECOGNIZED for unknown names
Status AbrToStatus(const std::string&);

const char* LanguageName(Language);
const char* LanguageExtension(Language);
bool ValidLanguage(int);

const char* SubmissionKindFlag(SubmissionKind);

#endif  // INCLUDE_NOJ_UTILS_H_
