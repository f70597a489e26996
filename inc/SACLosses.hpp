#pragma once


namespace SoftRacer{


// Losses of one update call. actor is 0 on calls that skip the policy step
class SACLosses{
public:
    float actor = 0;
    float qf_1 = 0;
    float qf_2 = 0;
    float vf = 0;
    float alpha = 0;

    [[nodiscard]] inline float total() const;
};


float SACLosses::total() const{
    return actor + qf_1 + qf_2 + vf + alpha;
}


}
