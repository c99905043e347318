#include "baseline.hh"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <set>

/////////////////////////////////////////////////////////////////////////////////////////////////////
// state_table
/////////////////////////////////////////////////////////////////////////////////////////////////////

const std::vector<state_info>& state_table()
{
  static const std::vector<state_info> states = {
    { "01", "AL", "Alabama" }, { "02", "AK", "Alaska" }, { "04", "AZ", "Arizona" },
    { "05", "AR", "Arkansas" }, { "06", "CA", "California" }, { "08", "CO", "Colorado" },
    { "09", "CT", "Connecticut" }, { "10", "DE", "Delaware" }, { "11", "DC", "District of Columbia" },
    { "12", "FL", "Florida" }, { "13", "GA", "Georgia" }, { "15", "HI", "Hawaii" },
    { "16", "ID", "Idaho" }, { "17", "IL", "Illinois" }, { "18", "IN", "Indiana" },
    { "19", "IA", "Iowa" }, { "20", "KS", "Kansas" }, { "21", "KY", "Kentucky" },
    { "22", "LA", "Louisiana" }, { "23", "ME", "Maine" }, { "24", "MD", "Maryland" },
    { "25", "MA", "Massachusetts" }, { "26", "MI", "Michigan" }, { "27", "MN", "Minnesota" },
    { "28", "MS", "Mississippi" }, { "29", "MO", "Missouri" }, { "30", "MT", "Montana" },
    { "31", "NE", "Nebraska" }, { "32", "NV", "Nevada" }, { "33", "NH", "New Hampshire" },
    { "34", "NJ", "New Jersey" }, { "35", "NM", "New Mexico" }, { "36", "NY", "New York" },
    { "37", "NC", "North Carolina" }, { "38", "ND", "North Dakota" }, { "39", "OH", "Ohio" },
    { "40", "OK", "Oklahoma" }, { "41", "OR", "Oregon" }, { "42", "PA", "Pennsylvania" },
    { "44", "RI", "Rhode Island" }, { "45", "SC", "South Carolina" }, { "46", "SD", "South Dakota" },
    { "47", "TN", "Tennessee" }, { "48", "TX", "Texas" }, { "49", "UT", "Utah" },
    { "50", "VT", "Vermont" }, { "51", "VA", "Virginia" }, { "53", "WA", "Washington" },
    { "54", "WV", "West Virginia" }, { "55", "WI", "Wisconsin" }, { "56", "WY", "Wyoming" }
  };
  return states;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// find_state
// accepts a 1 or 2 digit fips code or a postal abbreviation, case insensitive
/////////////////////////////////////////////////////////////////////////////////////////////////////

const state_info* find_state(const std::string& fips_or_postal)
{
  std::string key = fips_or_postal;
  for (size_t idx = 0; idx < key.size(); idx++)
  {
    key[idx] = static_cast<char>(std::toupper(static_cast<unsigned char>(key[idx])));
  }
  if (key.size() == 1 && std::isdigit(static_cast<unsigned char>(key[0])))
  {
    key = "0" + key;
  }

  const std::vector<state_info>& states = state_table();
  for (size_t idx = 0; idx < states.size(); idx++)
  {
    if (key == states[idx].fips || key == states[idx].postal)
    {
      return &states[idx];
    }
  }
  return nullptr;
}

std::string state_label(const std::string& state_fips)
{
  const state_info* info = find_state(state_fips);
  if (!info)
  {
    return "State " + state_fips;
  }
  return info->name;
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// normalize_fips
// "6037" -> "06037", same rule as LPAD(id, 5, '0') in the scenario database
/////////////////////////////////////////////////////////////////////////////////////////////////////

std::string normalize_fips(const std::string& id)
{
  size_t begin = 0;
  size_t end = id.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(id[begin]))) begin++;
  while (end > begin && std::isspace(static_cast<unsigned char>(id[end - 1]))) end--;

  std::string fips = id.substr(begin, end - begin);
  if (fips.empty() || fips.size() > 5)
  {
    return "";
  }
  for (size_t idx = 0; idx < fips.size(); idx++)
  {
    if (!std::isdigit(static_cast<unsigned char>(fips[idx])))
    {
      return "";
    }
  }
  return std::string(5 - fips.size(), '0') + fips;
}

std::string state_fips_of(const std::string& fips)
{
  if (fips.size() < 2)
  {
    return "";
  }
  return fips.substr(0, 2);
}

/////////////////////////////////////////////////////////////////////////////////////////////////////
// baseline_catalog_t
/////////////////////////////////////////////////////////////////////////////////////////////////////

baseline_catalog_t::baseline_catalog_t()
{
}

baseline_catalog_t::baseline_catalog_t(const std::vector<baseline_entity>& input)
{
  for (size_t idx = 0; idx < input.size(); idx++)
  {
    baseline_entity entity = input[idx];
    entity.fips = normalize_fips(entity.fips);
    if (entity.fips.empty())
    {
      std::cerr << "baseline: skipping invalid id [" << input[idx].fips << "]" << std::endl;
      continue;
    }
    entity.state_fips = state_fips_of(entity.fips);
    entity.expected_total_votes = std::max<int64_t>(0, entity.expected_total_votes);

    if (entities.count(entity.fips))
    {
      std::cerr << "baseline: duplicate id " << entity.fips << ", keeping the later row" << std::endl;
    }
    entities[entity.fips] = entity;
  }
}

const baseline_entity* baseline_catalog_t::find(const std::string& fips) const
{
  std::map<std::string, baseline_entity>::const_iterator it = entities.find(fips);
  if (it == entities.end())
  {
    return nullptr;
  }
  return &it->second;
}

bool baseline_catalog_t::contains(const std::string& fips) const
{
  return entities.count(fips) > 0;
}

std::vector<std::string> baseline_catalog_t::state_ids() const
{
  std::set<std::string> ids;
  for (std::map<std::string, baseline_entity>::const_iterator it = entities.begin(); it != entities.end(); ++it)
  {
    ids.insert(it->second.state_fips);
  }
  return std::vector<std::string>(ids.begin(), ids.end());
}
