#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "internal/reservation/reservation.hpp"
#include "internal/util/time.hpp"

namespace capacity::reservation {

/*
  ReservationTable

  Holds outstanding pre-dispatch reservations keyed by id. Expired entries
  are purged lazily on every access; an expired reservation can no longer
  be settled.
*/
class ReservationTable {
 public:
  ReservationTable(std::shared_ptr<const util::TimeSource> clock, std::chrono::milliseconds ttl);

  // Assigns a fresh id and expiry.
  Reservation Insert(Reservation reservation);

  // Removes and returns the reservation; nullopt if unknown, already taken
  // or expired.
  std::optional<Reservation> Take(const std::string& id);

  bool Contains(const std::string& id);

  std::size_t Size();

 private:
  void PurgeExpired(util::Timestamp now);

  std::shared_ptr<const util::TimeSource> clock_;
  std::chrono::milliseconds               ttl_;

  std::mutex                                   mutex_;
  std::unordered_map<std::string, Reservation> reservations_;
};

} // namespace capacity::reservation
