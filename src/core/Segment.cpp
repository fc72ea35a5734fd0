#include "Segment.h"
#include "StringUtils.h"

const char *availabilityName(Availability a) {
  switch (a) {
  case Availability::AvailableRemote:
    return "available-remote";
  case Availability::Downloading:
    return "downloading";
  case Availability::AvailableLocal:
    return "available-local";
  case Availability::Unavailable:
    return "unavailable";
  }
  return "unavailable";
}

Availability availabilityFromString(const std::string &s) {
  std::string v = StringUtils::toLower(StringUtils::trim(s));
  if (v == "u" || v == "unavailable")
    return Availability::Unavailable;
  if (v == "l" || v == "local" || v == "available-local")
    return Availability::AvailableLocal;
  if (v == "downloading")
    return Availability::Downloading;
  return Availability::AvailableRemote;
}

CredentialClass credentialForMethod(const std::string &downloadMethod) {
  if (StringUtils::toLower(downloadMethod) == "nsidc")
    return CredentialClass::BearerToken;
  return CredentialClass::None;
}
