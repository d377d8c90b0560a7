// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __PSEPOWER_EXCEPTION_H
#define __PSEPOWER_EXCEPTION_H 1

#include <stdexcept>
#include <string>

namespace psepower
{
  class PsePowerException : public std::runtime_error
  {
  public:
    explicit PsePowerException(const std::string& msg)
      : std::runtime_error(msg)
    {}

    virtual ~PsePowerException() = default;
  };

  // Malformed coefficient table or out-of-range run parameters. Always fatal.
  class ConfigurationException : public PsePowerException
  {
  public:
    explicit ConfigurationException(const std::string& msg)
      : PsePowerException("Configuration error: " + msg)
    {}
  };

  // logit() outside the open interval (0,1).
  class NumericDomainException : public PsePowerException
  {
  public:
    explicit NumericDomainException(const std::string& msg)
      : PsePowerException("Numeric domain error: " + msg)
    {}
  };

  enum class FitFailure
  {
    None,
    InsufficientResponseVariation,
    NonConvergence,
    FlatSlope,
    NonFiniteEstimate
  };

  inline const char* fitFailureName(FitFailure failure)
  {
    switch (failure)
      {
      case FitFailure::None:
	return "none";
      case FitFailure::InsufficientResponseVariation:
	return "insufficient-response-variation";
      case FitFailure::NonConvergence:
	return "non-convergence";
      case FitFailure::FlatSlope:
	return "flat-slope";
      case FitFailure::NonFiniteEstimate:
	return "non-finite-estimate";
      }
    return "unknown";
  }

  // A single logistic fit could not produce a usable PSE. Recoverable: the
  // caller marks the group invalid and keeps going.
  class DegenerateFitException : public PsePowerException
  {
  public:
    DegenerateFitException(FitFailure reason, const std::string& msg)
      : PsePowerException("Degenerate fit (" + std::string(fitFailureName(reason)) + "): " + msg),
	mReason(reason)
    {}

    FitFailure getReason() const
    {
      return mReason;
    }

  private:
    FitFailure mReason;
  };

  // Too few complete subjects (or no residual variance) left for the ANOVA.
  class InsufficientDesignException : public PsePowerException
  {
  public:
    explicit InsufficientDesignException(const std::string& msg)
      : PsePowerException("Insufficient design: " + msg)
    {}
  };
} // namespace psepower

#endif // __PSEPOWER_EXCEPTION_H
